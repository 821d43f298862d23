/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <coro/coro.hpp>
#include <nlohmann/json.hpp>

#include <colony/error_codes.h>

namespace colony
{
    // A request waiting for its correlated response
    struct pending_request
    {
        std::string id;
        std::chrono::steady_clock::time_point deadline;
        // set exactly once, after error_code and response are written
        coro::event resolved;
        int error_code = error::OK();
        nlohmann::json response;
    };

    /**
     * @brief Outstanding requests keyed by request id
     *
     * Whoever erases an entry resolves it: resolve(), fail() and fail_all() remove the
     * entry under the lock and signal it after the lock is released. A second attempt to
     * resolve the same id finds nothing, so no request is resolved twice.
     */
    class correlation_table
    {
    public:
        // nullptr if id is already outstanding
        std::shared_ptr<pending_request> insert(const std::string& id, std::chrono::steady_clock::time_point deadline);

        // false if id is not outstanding
        bool resolve(const std::string& id, nlohmann::json response);

        bool fail(const std::string& id, int error_code);

        // Resolves every outstanding request with error_code, returns how many there were
        size_t fail_all(int error_code);

        bool contains(const std::string& id) const;
        size_t size() const;

    private:
        std::shared_ptr<pending_request> take(const std::string& id);

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<pending_request>> pending_;
    };
}
