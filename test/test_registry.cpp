#include <unity.h>

#include <string>
#include <vector>

#include "FakeTransport.h"
#include "GattRegistry.h"

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

using qcardio::AnnotationEntry;
using qcardio::Characteristic;
using qcardio::ErrorCode;
using qcardio::GattRegistry;
using qcardio::test::FakeTransport;

namespace {
const std::vector<AnnotationEntry> kVendor = {
    {qcardio::test::kControlPointUuid, "QardioArm Control Point"},
};
}

static void test_normalize_uuid_forms() {
    const std::string full = "00002a35-0000-1000-8000-00805f9b34fb";
    TEST_ASSERT_EQUAL_STRING(full.c_str(), qcardio::normalizeUuid("2a35").c_str());
    TEST_ASSERT_EQUAL_STRING(full.c_str(), qcardio::normalizeUuid("0x2A35").c_str());
    TEST_ASSERT_EQUAL_STRING(full.c_str(), qcardio::normalizeUuid("{00002A35-0000-1000-8000-00805F9B34FB}").c_str());
    TEST_ASSERT_EQUAL_STRING(full.c_str(), qcardio::normalizeUuid("00002a35").c_str());
    TEST_ASSERT_EQUAL_STRING(full.c_str(), qcardio::sigUuid(0x2A35).c_str());
    TEST_ASSERT_EQUAL_STRING("583cb5b3-875d-40ed-9098-c39eb0c1983d",
                             qcardio::normalizeUuid("583CB5B3-875D-40ED-9098-C39EB0C1983D").c_str());
}

static void test_properties_label_order() {
    using namespace qcardio::char_props;
    TEST_ASSERT_EQUAL_STRING("read,notify", qcardio::propertiesLabel(kNotify | kRead).c_str());
    TEST_ASSERT_EQUAL_STRING("read,write,write-without-response,notify,indicate",
                             qcardio::propertiesLabel(kIndicate | kNotify | kWriteNoResponse | kWrite | kRead).c_str());
    TEST_ASSERT_EQUAL_STRING("", qcardio::propertiesLabel(0).c_str());
}

static void test_annotate_sig_vendor_and_unknown() {
    GattRegistry registry(kVendor);
    TEST_ASSERT_EQUAL_STRING("Blood Pressure Measurement", registry.annotate("2a35")->c_str());
    TEST_ASSERT_EQUAL_STRING("Battery Service", registry.annotate("0x180F")->c_str());
    TEST_ASSERT_EQUAL_STRING("QardioArm Control Point", registry.annotate(qcardio::test::kControlPointUuid)->c_str());
    TEST_ASSERT_FALSE(registry.annotate("ffe1").has_value());

    GattRegistry plain;
    TEST_ASSERT_FALSE(plain.annotate(qcardio::test::kControlPointUuid).has_value());
}

static void test_discover_builds_annotated_catalog() {
    FakeTransport transport;
    transport.services = qcardio::test::qardioArmServices();
    transport.linkUp = true;

    GattRegistry registry(kVendor);
    TEST_ASSERT_EQUAL(ErrorCode::Ok, registry.discover(transport, 7));
    TEST_ASSERT_TRUE(registry.valid());
    TEST_ASSERT_EQUAL_UINT32(7, registry.sessionId());
    TEST_ASSERT_EQUAL_UINT(5, registry.catalog().size());

    const auto& bp = registry.catalog()[3];
    TEST_ASSERT_EQUAL_STRING(qcardio::sigUuid(0x1810).c_str(), bp.uuid.c_str());
    TEST_ASSERT_EQUAL_STRING("Blood Pressure", bp.annotation.c_str());

    const Characteristic* control = registry.find(qcardio::test::kControlPointUuid);
    TEST_ASSERT_NOT_NULL(control);
    TEST_ASSERT_EQUAL_STRING("QardioArm Control Point", control->annotation.c_str());
    TEST_ASSERT_TRUE(control->canWrite());
    TEST_ASSERT_TRUE(control->canNotify());
    TEST_ASSERT_FALSE(control->canRead());
    TEST_ASSERT_EQUAL_UINT16(40, control->handle);

    const Characteristic* measurement = registry.find("0x2A35");
    TEST_ASSERT_NOT_NULL(measurement);
    TEST_ASSERT_TRUE(measurement->canNotify());

    TEST_ASSERT_NULL(registry.find("ffe1"));
}

static void test_invalidated_catalog_answers_nothing() {
    FakeTransport transport;
    transport.services = qcardio::test::qardioArmServices();
    transport.linkUp = true;

    GattRegistry registry;
    TEST_ASSERT_EQUAL(ErrorCode::Ok, registry.discover(transport, 1));
    TEST_ASSERT_NOT_NULL(registry.find("2a19"));

    registry.invalidate();
    TEST_ASSERT_FALSE(registry.valid());
    TEST_ASSERT_TRUE(registry.catalog().empty());
    TEST_ASSERT_NULL(registry.find("2a19"));
}

static void test_discover_requires_connection() {
    FakeTransport transport;
    transport.services = qcardio::test::qardioArmServices();

    GattRegistry registry;
    TEST_ASSERT_EQUAL(ErrorCode::NotConnected, registry.discover(transport, 1));
    TEST_ASSERT_FALSE(registry.valid());
    TEST_ASSERT_EQUAL(0, transport.discoverCalls);

    transport.linkUp = true;
    transport.discoverResult = ErrorCode::ReadFailed;
    TEST_ASSERT_EQUAL(ErrorCode::ReadFailed, registry.discover(transport, 1));
    TEST_ASSERT_FALSE(registry.valid());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_normalize_uuid_forms);
    RUN_TEST(test_properties_label_order);
    RUN_TEST(test_annotate_sig_vendor_and_unknown);
    RUN_TEST(test_discover_builds_annotated_catalog);
    RUN_TEST(test_invalidated_catalog_answers_nothing);
    RUN_TEST(test_discover_requires_connection);
    return UNITY_END();
}
