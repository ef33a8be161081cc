#include "DeviceTypes.h"

#include <cctype>

namespace qcardio {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool sameDevice(const DeviceDescriptor& a, const DeviceDescriptor& b) {
    return equalsIgnoreCase(a.address, b.address) && a.adapter == b.adapter;
}

const std::string* findField(const FieldList& fields, const std::string& key) {
    for (const auto& entry : fields) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

}  // namespace qcardio
