#pragma once

#include "restcore/logging/logger.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace restcore::infrastructure::net {

// One io_context per thread; connections are spread round-robin.
class IoContextPool {
public:
    explicit IoContextPool(std::size_t pool_size, logging::LoggerPtr logger = logging::null_logger());
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void start();
    void stop();

    boost::asio::io_context& get_io_context();
    std::size_t size() const noexcept;

private:
    using IoContextPtr = std::unique_ptr<boost::asio::io_context>;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    struct ContextEntry {
        IoContextPtr io_context;
        std::unique_ptr<WorkGuard> work_guard;
    };

    logging::LoggerPtr logger_;
    std::vector<ContextEntry> contexts_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> next_{0};
    std::atomic<bool> running_{false};
};

} // namespace restcore::infrastructure::net
