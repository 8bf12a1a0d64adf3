#pragma once

#include <cstddef>
#include <variant>

// bool for plain success/failure tasks, size_t for tasks that report how many items they handled
typedef std::variant<bool, std::size_t> ExpectedFuture;
