// include/settings/DbSettings.hpp
#pragma once

#include "settings/EnvReader.hpp"
#include <string>

namespace escrow::settings
{

    /**
     * @brief Подключение к PostgreSQL с escrow-схемой
     *
     * ESCROW_DB_HOST, ESCROW_DB_PORT, ESCROW_DB_NAME, ESCROW_DB_USER, ESCROW_DB_PASSWORD.
     * ESCROW_DB_CONNECT_TIMEOUT (секунды) уходит в connect_timeout libpq.
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(env::text("ESCROW_DB_HOST", "escrow-postgres")),
              port_(static_cast<int>(env::integer("ESCROW_DB_PORT", 5432, 1, 65535))),
              name_(env::text("ESCROW_DB_NAME", "escrow_db")),
              user_(env::text("ESCROW_DB_USER", "escrow_user")),
              password_(env::text("ESCROW_DB_PASSWORD", "escrow_password")),
              connectTimeoutSeconds_(static_cast<int>(env::integer("ESCROW_DB_CONNECT_TIMEOUT", 5, 1, 300)))
        {
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }

        /**
         * @brief Строка подключения libpq (key=value)
         */
        std::string getConnectionString() const
        {
            return "host=" + host_ +
                   " port=" + std::to_string(port_) +
                   " dbname=" + name_ +
                   " user=" + user_ +
                   " password=" + password_ +
                   " connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
                   " application_name=escrow-service";
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSeconds_;
    };

} // namespace escrow::settings
