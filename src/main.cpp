#include <Arduino.h>
#include <NimBLEDevice.h>

#include <cstdio>
#include <memory>
#include <string>

#include <esp_task_wdt.h>

#include "BridgeController.h"
#include "Clock.h"
#include "Config.h"
#include "NimBleTransport.h"
#include "PersistentConfig.h"
#include "PluginRegistry.h"
#include "RecordCodec.h"
#include "proto/qcardio.pb.h"

using qcardio::BridgeController;
using qcardio::DeviceDescriptor;

static NimBLEServer* g_server = nullptr;
static NimBLECharacteristic* g_tx = nullptr;
static NimBLECharacteristic* g_infoChar = nullptr;
static NimBLECharacteristic* g_commandChar = nullptr;

static qcardio::SystemClock g_clock;
static qcardio::NimBleTransport g_transport;
static std::unique_ptr<BridgeController> g_controller;

static volatile bool g_clientConnected = false;
static uint32_t g_connectedAtMs = 0;
static int g_lastDisconnectReason = 0;

static bool sendEvent(const com_qcardio_bridge_BridgeEvent& event);

static std::string buildInfoString() {
    std::string info = std::string("name=") + BRIDGE_DEVICE_NAME + "\nfw=" + BRIDGE_FIRMWARE_VERSION;
    if (g_controller) {
        const DeviceDescriptor& device = g_controller->device();
        info += "\ntype=";
        info += device.type;
        info += "\naddress=";
        info += device.address.empty() ? "unset" : device.address;
    }
    return info;
}

class RxCallback : public NimBLECharacteristicCallbacks {
    void onWrite(NimBLECharacteristic* characteristic, NimBLEConnInfo& connInfo) override {
        if (!connInfo.isEncrypted()) {
            Serial.println("[BLE] write on unencrypted link, requesting pairing");
            NimBLEDevice::startSecurity(connInfo.getConnHandle());
            return;
        }
        if (!g_controller) {
            return;
        }
        const std::string frame = characteristic->getValue();
        if (!g_controller->acceptFrame(reinterpret_cast<const uint8_t*>(frame.data()), frame.size())) {
            Serial.println("[BLE] <- command rejected");
        }
    }
};

class InfoCallback : public NimBLECharacteristicCallbacks {
    void onRead(NimBLECharacteristic* characteristic, NimBLEConnInfo&) override {
        characteristic->setValue(buildInfoString());
    }
};

class ServerCallback : public NimBLEServerCallbacks {
    void onConnect(NimBLEServer*, NimBLEConnInfo& connInfo) override {
        g_clientConnected = true;
        g_connectedAtMs = millis();
        Serial.printf("[BLE] client connected %s handle=%u\n", connInfo.getAddress().toString().c_str(),
                      connInfo.getConnHandle());
    }

    void onDisconnect(NimBLEServer*, NimBLEConnInfo&, int reason) override {
        g_clientConnected = false;
        g_lastDisconnectReason = reason;
        Serial.printf("[BLE] client disconnected after %lu s, reason=0x%x\n",
                      static_cast<unsigned long>((millis() - g_connectedAtMs) / 1000), reason);

        // Authentication failure, missing key or pairing timeout: start over with a fresh bond.
        if (reason == 0x05 || reason == 0x06 || reason == 0x3D) {
            Serial.println("[BLE] clearing bonds");
            NimBLEDevice::deleteAllBonds();
        }

        if (!NimBLEDevice::startAdvertising()) {
            Serial.println("[BLE] advertising restart failed, retrying");
            NimBLEDevice::startAdvertising();
        }
    }

    void onMTUChange(uint16_t MTU, NimBLEConnInfo&) override {
        Serial.printf("[BLE] MTU %u\n", MTU);
    }

    void onAuthenticationComplete(NimBLEConnInfo& connInfo) override {
        Serial.printf("[BLE] authentication complete encrypted=%d authenticated=%d\n", connInfo.isEncrypted(),
                      connInfo.isAuthenticated());
    }
};

static bool sendEvent(const com_qcardio_bridge_BridgeEvent& event) {
    if (!g_tx || !g_clientConnected) {
        // Events produced while no client is attached are dropped.
        return false;
    }

    qcardio::FrameBuffer frame{};
    size_t frameLength = 0;
    if (!qcardio::encodeEvent(event, frame, frameLength)) {
        return false;
    }
    if (frameLength > BRIDGE_MTU - 3) {
        Serial.printf("[BLE] event of %u bytes exceeds MTU payload\n", static_cast<unsigned>(frameLength));
    }

    g_tx->setValue(frame.data(), frameLength);
    if (!g_tx->notify()) {
        Serial.println("[BLE] event notify failed");
        return false;
    }
    return true;
}

static void setupController() {
    DeviceDescriptor device;
    device.type = DEFAULT_DEVICE_TYPE;

    qcardio::PersistentSettings stored;
    if (qcardio::loadPersistentSettings(stored)) {
        Serial.println("[BOOT] applying stored settings");
        qcardio::applyPersistentSettings(stored, device);
    }

    g_controller = std::make_unique<BridgeController>(
        g_transport, g_clock, [](const com_qcardio_bridge_BridgeEvent& evt) { sendEvent(evt); });
    if (!g_controller->configure(device)) {
        Serial.printf("[BOOT] unknown device type '%s'\n", device.type.c_str());
    }
}

static void setupBLE() {
    Serial.printf("[BLE] init %s passkey=%06d\n", BRIDGE_DEVICE_NAME, BLE_FIXED_PASSKEY);

    NimBLEDevice::init(BRIDGE_DEVICE_NAME);
    NimBLEDevice::setDeviceName(BRIDGE_DEVICE_NAME);
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);
    NimBLEDevice::setMTU(BRIDGE_MTU);

    NimBLEDevice::setSecurityAuth(true, true, true);
    NimBLEDevice::setSecurityIOCap(BLE_HS_IO_DISPLAY_ONLY);
    NimBLEDevice::setSecurityPasskey(BLE_FIXED_PASSKEY);

    g_server = NimBLEDevice::createServer();
    g_server->setCallbacks(new ServerCallback());
    NimBLEService* service = g_server->createService(BRIDGE_SERVICE_UUID);

    g_commandChar = service->createCharacteristic(
        BRIDGE_CHAR_COMMAND_UUID, NIMBLE_PROPERTY::WRITE | NIMBLE_PROPERTY::WRITE_NR | NIMBLE_PROPERTY::WRITE_ENC);
    g_commandChar->setCallbacks(new RxCallback());

    g_tx = service->createCharacteristic(BRIDGE_CHAR_EVENT_UUID, NIMBLE_PROPERTY::NOTIFY | NIMBLE_PROPERTY::READ);

    g_infoChar = service->createCharacteristic(BRIDGE_CHAR_INFO_UUID, NIMBLE_PROPERTY::READ);
    g_infoChar->setCallbacks(new InfoCallback());

    service->start();
    g_infoChar->setValue(buildInfoString());

    NimBLEAdvertising* advertising = NimBLEDevice::getAdvertising();
    NimBLEAdvertisementData primary;
    primary.setFlags(BLE_HS_ADV_F_DISC_GEN | BLE_HS_ADV_F_BREDR_UNSUP);
    primary.addServiceUUID(BRIDGE_SERVICE_UUID);
    advertising->setAdvertisementData(primary);

    NimBLEAdvertisementData response;
    response.setName(BRIDGE_DEVICE_NAME);
    advertising->setScanResponseData(response);
    // 100..200 ms in 0.625 ms units.
    advertising->setMinInterval(160);
    advertising->setMaxInterval(320);

    if (!NimBLEDevice::startAdvertising()) {
        Serial.println("[BLE] advertising failed to start");
        return;
    }
    Serial.println("[BLE] advertising");
}

static const char* resetReasonLabel(esp_reset_reason_t reason) {
    switch (reason) {
        case ESP_RST_POWERON:
            return "power-on";
        case ESP_RST_SW:
            return "software";
        case ESP_RST_PANIC:
            return "panic";
        case ESP_RST_INT_WDT:
            return "interrupt-wdt";
        case ESP_RST_TASK_WDT:
            return "task-wdt";
        case ESP_RST_WDT:
            return "wdt";
        case ESP_RST_BROWNOUT:
            return "brownout";
        case ESP_RST_DEEPSLEEP:
            return "deep-sleep";
        default:
            return "unknown";
    }
}

void setup() {
    Serial.begin(115200);
    delay(100);
    Serial.printf("\n[BOOT] %s fw=%s reset=%s heap=%u\n", BRIDGE_DEVICE_NAME, BRIDGE_FIRMWARE_VERSION,
                  resetReasonLabel(esp_reset_reason()), ESP.getFreeHeap());

    esp_task_wdt_init(WDT_TIMEOUT_S, true);
    esp_task_wdt_add(NULL);

    setupBLE();
    setupController();
    if (g_infoChar) {
        g_infoChar->setValue(buildInfoString());
    }

    size_t pluginCount = 0;
    const qcardio::PluginEntry* plugins = qcardio::pluginTable(pluginCount);
    for (size_t i = 0; i < pluginCount; ++i) {
        Serial.printf("[BOOT] plugin %s: %s\n", plugins[i].typeId, plugins[i].displayName);
    }
    Serial.println("[BOOT] ready");

    esp_task_wdt_reset();
}

static void logStatus(uint32_t nowMs) {
    Serial.printf("[STATUS] up=%lus client=%d last_disc=0x%x heap=%u", static_cast<unsigned long>(nowMs / 1000),
                  g_clientConnected ? 1 : 0, g_lastDisconnectReason, ESP.getFreeHeap());
    if (g_controller && g_controller->plugin()) {
        const DeviceDescriptor& device = g_controller->device();
        Serial.printf(" device=%s/%s pending=%u", device.type.c_str(),
                      device.address.empty() ? "any" : device.address.c_str(),
                      static_cast<unsigned>(g_controller->pendingCommands()));
    }
    Serial.println();
}

void loop() {
    const uint32_t nowMs = millis();

    static uint32_t lastStatusMs = 0;
    if (nowMs - lastStatusMs >= STATUS_INTERVAL_MS) {
        logStatus(nowMs);
        lastStatusMs = nowMs;
    }

    static uint32_t lastFeedMs = 0;
    if (nowMs - lastFeedMs >= WDT_FEED_INTERVAL_MS) {
        esp_task_wdt_reset();
        lastFeedMs = nowMs;
    }

    if (g_controller) {
        g_controller->service();
    }

    delay(ENGINE_SERVICE_INTERVAL_MS);
}
