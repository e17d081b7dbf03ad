#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace planfix {

enum class Status {
    ok,
    not_calibrated,
    degenerate
};

const char* to_string(Status status);

template<typename T>
class Result {
public:
    Result(T value) : status_(Status::ok), value_(std::move(value)) {}

    static Result failure(Status status) {
        if (status == Status::ok) {
            throw std::invalid_argument("Result::failure requires a failure status");
        }
        return Result(status);
    }

    bool ok() const { return status_ == Status::ok; }
    explicit operator bool() const { return ok(); }
    Status status() const { return status_; }

    const T& value() const {
        if (!ok()) throw std::logic_error(std::string("Result has no value: ") + to_string(status_));
        return value_;
    }

    T value_or(T fallback) const { return ok() ? value_ : fallback; }

    const T& operator*() const { return value(); }
    const T* operator->() const { return &value(); }

private:
    explicit Result(Status status) : status_(status), value_() {}

    Status status_;
    T value_;
};

} // namespace planfix
