#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "clients.hpp"
#include "database.hpp"

// Throw-away database provisioned from init.sql, removed again on destruction.
struct LedgerFixture {
    database::Options options;
    std::unique_ptr<clients::Table> table;

    explicit LedgerFixture(const std::string &name) {
        options.path = (std::filesystem::temp_directory_path() / ("ledger_" + name + ".db")).string();
        options.busyTimeoutMs = 10000;
        cleanup();
        database::provision(options, LEDGER_INIT_SQL, true);
        table = clients::load(options).value();
    }

    ~LedgerFixture() {
        table.reset();
        cleanup();
    }

    void cleanup() {
        std::error_code ec;
        for (const char *suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(options.path + suffix, ec);
        }
    }

    database::ConnectionPtr connect(database::TRANSACTION_MODE mode = database::TRANSACTION_MODE::NONE) {
        return database::getConnection(options, mode).value();
    }

    std::int64_t balanceOf(int clientId) {
        auto connection = connect();
        return database::getBalance(connection.get(), clientId).value().total;
    }

    std::int64_t loggedSumOf(int clientId) {
        auto connection = connect();
        return database::sumTransactionsByClientId(connection.get(), clientId).value();
    }
};
