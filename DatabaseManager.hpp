// File: DatabaseManager.hpp
// Description: Connection source for PgPlayerStore. Every store operation
// opens its own connection from a db pool thread.
#pragma once

#include <pqxx/pqxx>
#include <array>
#include <string>
#include <stdexcept>
#include <iostream>

class DatabaseManager {
private:
    std::string connection_string_;

    // Tables the arena reads and writes; created by sql/schema.sql.
    static constexpr std::array<const char*, 4> kArenaTables{ "User", "Character", "Sword", "session" };

    void check_schema(pqxx::connection& C) {
        pqxx::nontransaction N(C);
        for (const char* table : kArenaTables) {
            pqxx::result R = N.exec(pqxx::zview("SELECT to_regclass($1) IS NOT NULL AS present"),
                pqxx::params(std::string("public.\"") + table + "\""));
            if (!R[0]["present"].as<bool>())
                throw std::runtime_error(std::string("table \"") + table + "\" is missing; apply sql/schema.sql");
        }
    }

public:
    explicit DatabaseManager(const std::string& conn_str)
        : connection_string_(conn_str) {
        try {
            pqxx::connection C(connection_string_);
            check_schema(C);
            std::cout << "[DB] Arena schema found in " << C.dbname() << std::endl;
        }
        catch (const std::exception& e) {
            std::cerr << "[DB ERROR] Startup check failed: " << e.what() << std::endl;
            throw; // the arena cannot run without its accounts
        }
    }

    pqxx::connection get_connection() {
        return pqxx::connection(connection_string_);
    }
};
