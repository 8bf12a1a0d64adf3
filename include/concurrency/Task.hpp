#pragma once

#include "types.hpp"

#include <future>
#include <optional>

namespace bk::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Optional future for reporting
    virtual std::optional<std::future<ExpectedFuture>> getFuture() { return std::nullopt; }
};

// The subclass fulfils the promise (value or exception) before operator() returns.
struct PromisedTask : Task {
    std::promise<ExpectedFuture> promise;

    std::optional<std::future<ExpectedFuture>> getFuture() override { return promise.get_future(); }
};

}
