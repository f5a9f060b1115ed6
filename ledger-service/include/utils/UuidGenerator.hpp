#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledger::utils {

/**
 * @brief Генератор идентификаторов записей
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Короткий ID с префиксом: "prefix-xxxxxxxxxxxxxxxx"
     *
     * @param prefix "acc", "txn", "snp"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
        return ss.str();
    }
};

} // namespace ledger::utils
