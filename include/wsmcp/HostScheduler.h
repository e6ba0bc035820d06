//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostScheduler.h
// Purpose: Deferred execution on the host's single execution context, awaitable from coroutines
//==========================================================================================================

#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio.hpp>

#include "wsmcp/JSONRPCTypes.h"

namespace wsmcp {

//==========================================================================================================
// IHostScheduler
// Purpose: Accepts zero-argument callbacks to be run on a later turn of the host's execution context,
//          never inline in the caller.
//==========================================================================================================
class IHostScheduler {
public:
    virtual ~IHostScheduler() = default;
    virtual void Post(std::function<void()> work) = 0;
};

//==========================================================================================================
// AsioHostScheduler
// Purpose: IHostScheduler backed by the io_context that also runs all network I/O.
//==========================================================================================================
class AsioHostScheduler : public IHostScheduler {
public:
    explicit AsioHostScheduler(boost::asio::io_context& ioc);
    void Post(std::function<void()> work) override;

private:
    boost::asio::io_context& ioc;
};

//==========================================================================================================
// AsyncRunOnHost
// Purpose: Asynchronous operation that submits work through the host scheduler and completes with
//          its result on the caller's associated executor.
// Args:
//   host: Scheduler that runs the work on a later turn.
//   work: Callable producing the result; an exception thrown by it is delivered as the error.
//   token: Completion token; with boost::asio::use_awaitable the result is co_await-able and the
//          work's exception is rethrown at the co_await.
// Completion signature:
//   void(std::exception_ptr, JSONValue)
//==========================================================================================================
template <typename CompletionToken>
auto AsyncRunOnHost(IHostScheduler& host, std::function<JSONValue()> work, CompletionToken&& token) {
    return boost::asio::async_initiate<CompletionToken, void(std::exception_ptr, JSONValue)>(
        [&host](auto handler, std::function<JSONValue()> fn) {
            // std::function needs a copyable target; the completion handler is move-only
            using Handler = std::decay_t<decltype(handler)>;
            auto shared = std::make_shared<Handler>(std::move(handler));
            host.Post([shared, fn = std::move(fn)]() {
                std::exception_ptr failure;
                JSONValue out;
                try {
                    out = fn();
                } catch (...) {
                    failure = std::current_exception();
                }
                auto ex = boost::asio::get_associated_executor(*shared);
                boost::asio::dispatch(ex, [shared, failure, out = std::move(out)]() mutable {
                    (*shared)(failure, std::move(out));
                });
            });
        },
        token, std::move(work));
}

} // namespace wsmcp
