#pragma once

#include <settings/IServerSettings.hpp>
#include "settings/EnvReader.hpp"
#include <string>

namespace escrow::settings {

/**
 * @brief Адрес HTTP API: SERVER_HOST, SERVER_PORT (по умолчанию 0.0.0.0:8084)
 */
class ServerSettings : public IServerSettings {
public:
    ServerSettings()
        : host_(env::text("SERVER_HOST", "0.0.0.0"))
        , port_(static_cast<uint16_t>(env::integer("SERVER_PORT", 8084, 1, 65535)))
    {
    }

    std::string getHost() const override { return host_; }
    uint16_t getPort() const override { return port_; }

private:
    std::string host_;
    uint16_t port_;
};

} // namespace escrow::settings
