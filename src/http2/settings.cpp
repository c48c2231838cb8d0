#include "h2wire/http2/settings.hpp"
#include "h2wire/core/logging.hpp"

#include <string>

namespace h2wire::http2 {

namespace {

void log_update(const char* name, uint32_t value) {
    log_debug(std::string("Updated ") + name + " to " + std::to_string(value));
}

} // anonymous namespace

bool Settings::apply(uint16_t key, uint32_t value) {
    switch (static_cast<SettingsId>(key)) {
        case SettingsId::HeaderTableSize:
            header_table_size = value;
            log_update("header_table_size", value);
            return true;
        case SettingsId::EnablePush:
            enable_push = value != 0;
            log_update("enable_push", value);
            return true;
        case SettingsId::MaxConcurrentStreams:
            max_concurrent_streams = value;
            log_update("max_concurrent_streams", value);
            return true;
        case SettingsId::InitialWindowSize:
            initial_window_size = value;
            log_update("initial_window_size", value);
            return true;
        case SettingsId::MaxFrameSize:
            max_frame_size = value;
            log_update("max_frame_size", value);
            return true;
        default:
            log_debug("Ignoring unknown setting " + std::to_string(key) +
                      " = " + std::to_string(value));
            return false;
    }
}

void Settings::apply_all(std::span<const SettingsEntry> entries) {
    for (const auto& entry : entries) {
        apply(entry.id, entry.value);
    }
}

expected<void, Error> Settings::validate(uint16_t key, uint32_t value) {
    switch (static_cast<SettingsId>(key)) {
        case SettingsId::EnablePush:
            if (value > 1) {
                return unexpected(Error::protocol(ProtocolError::InvalidSettingValue,
                    "ENABLE_PUSH must be 0 or 1, got " + std::to_string(value)));
            }
            break;
        case SettingsId::InitialWindowSize:
            if (value > Constants::MaxWindowSize) {
                return unexpected(Error::protocol(ProtocolError::InvalidSettingValue,
                    "INITIAL_WINDOW_SIZE above 2^31-1: " + std::to_string(value)));
            }
            break;
        case SettingsId::MaxFrameSize:
            if (value < Constants::MinMaxFrameSize || value > Constants::MaxMaxFrameSize) {
                return unexpected(Error::protocol(ProtocolError::InvalidSettingValue,
                    "MAX_FRAME_SIZE out of range: " + std::to_string(value)));
            }
            break;
        default:
            break;
    }
    return {};
}

} // namespace h2wire::http2
