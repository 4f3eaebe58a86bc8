#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace ses::domain {

// Expected-version mismatch on append. Retryable by re-fetching the stream.
class ConcurrencyError : public std::runtime_error {
public:
    ConcurrencyError(std::string aggregate_id, uint64_t expected_version, uint64_t actual_version)
        : std::runtime_error("Concurrency conflict for aggregate " + aggregate_id
                             + ": expected version " + std::to_string(expected_version)
                             + ", actual " + std::to_string(actual_version))
        , aggregate_id_(std::move(aggregate_id))
        , expected_version_(expected_version)
        , actual_version_(actual_version) {}

    const std::string& aggregate_id() const noexcept { return aggregate_id_; }
    uint64_t expected_version() const noexcept { return expected_version_; }
    uint64_t actual_version() const noexcept { return actual_version_; }

private:
    std::string aggregate_id_;
    uint64_t expected_version_;
    uint64_t actual_version_;
};

// A command was invoked against an aggregate whose state forbids it.
class InvalidStateError : public std::logic_error {
public:
    InvalidStateError(std::string aggregate_id, std::string state)
        : std::logic_error("Aggregate " + aggregate_id + " is " + state)
        , aggregate_id_(std::move(aggregate_id))
        , state_(std::move(state)) {}

    const std::string& aggregate_id() const noexcept { return aggregate_id_; }
    const std::string& state() const noexcept { return state_; }

private:
    std::string aggregate_id_;
    std::string state_;
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(std::string aggregate_id)
        : std::runtime_error(aggregate_id.empty()
                                 ? std::string("Aggregate not found: empty event stream")
                                 : "Aggregate not found: " + aggregate_id)
        , aggregate_id_(std::move(aggregate_id)) {}

    const std::string& aggregate_id() const noexcept { return aggregate_id_; }

private:
    std::string aggregate_id_;
};

// One projector failed on one event. Contained by the projector runner.
class ProjectionError : public std::runtime_error {
public:
    ProjectionError(std::string projector, std::string event_id, const std::string& cause)
        : std::runtime_error("Projector " + projector + " failed on event " + event_id + ": " + cause)
        , projector_(std::move(projector))
        , event_id_(std::move(event_id))
        , cause_(cause) {}

    const std::string& projector() const noexcept { return projector_; }
    const std::string& event_id() const noexcept { return event_id_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::string projector_;
    std::string event_id_;
    std::string cause_;
};

class EmptyMessageError : public std::invalid_argument {
public:
    EmptyMessageError() : std::invalid_argument("Message content cannot be empty") {}
};

class MessageTooLongError : public std::invalid_argument {
public:
    MessageTooLongError(std::size_t actual, std::size_t max)
        : std::invalid_argument("Message too long: " + std::to_string(actual)
                                + " characters (max: " + std::to_string(max) + ")") {}
};

class InvalidSessionIdError : public std::invalid_argument {
public:
    explicit InvalidSessionIdError(const std::string& value)
        : std::invalid_argument("Invalid session ID: " + value) {}
};

} // namespace ses::domain
