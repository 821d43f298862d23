/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <vector>

#include <colony/correlation_table.h>

namespace colony
{
    std::shared_ptr<pending_request> correlation_table::insert(
        const std::string& id, std::chrono::steady_clock::time_point deadline)
    {
        auto request = std::make_shared<pending_request>();
        request->id = id;
        request->deadline = deadline;

        std::scoped_lock lock(mutex_);
        auto [it, inserted] = pending_.emplace(id, request);
        if (!inserted)
            return nullptr;
        return request;
    }

    std::shared_ptr<pending_request> correlation_table::take(const std::string& id)
    {
        std::scoped_lock lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end())
            return nullptr;
        auto request = std::move(it->second);
        pending_.erase(it);
        return request;
    }

    bool correlation_table::resolve(const std::string& id, nlohmann::json response)
    {
        auto request = take(id);
        if (!request)
            return false;
        request->response = std::move(response);
        request->error_code = error::OK();
        request->resolved.set();
        return true;
    }

    bool correlation_table::fail(const std::string& id, int error_code)
    {
        auto request = take(id);
        if (!request)
            return false;
        request->error_code = error_code;
        request->resolved.set();
        return true;
    }

    size_t correlation_table::fail_all(int error_code)
    {
        std::vector<std::shared_ptr<pending_request>> requests;
        {
            std::scoped_lock lock(mutex_);
            requests.reserve(pending_.size());
            for (auto& [id, request] : pending_)
            {
                requests.push_back(std::move(request));
            }
            pending_.clear();
        }

        for (auto& request : requests)
        {
            request->error_code = error_code;
            request->resolved.set();
        }
        return requests.size();
    }

    bool correlation_table::contains(const std::string& id) const
    {
        std::scoped_lock lock(mutex_);
        return pending_.find(id) != pending_.end();
    }

    size_t correlation_table::size() const
    {
        std::scoped_lock lock(mutex_);
        return pending_.size();
    }
}
