#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace stocksync {

/**
 * Base exception for all sync engine errors.
 */
class SyncError : public std::runtime_error {
public:
    explicit SyncError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the SKU, channel or listing does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if a uniqueness constraint rejected the call.
     */
    virtual bool is_duplicate() const { return false; }

    /**
     * Returns true if an input was malformed or out of range.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if the call conflicts with current engine state.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Map this error to the status returned by the command surface.
     */
    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::INTERNAL, what());
    }
};

/**
 * Thrown when a SKU, channel entry or listing is unknown.
 */
class NotFoundError : public SyncError {
public:
    explicit NotFoundError(const std::string& message)
        : SyncError(message) {}

    bool is_not_found() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
    }
};

/**
 * Thrown when a mapping already exists for the SKU.
 */
class DuplicateSkuError : public SyncError {
public:
    explicit DuplicateSkuError(const std::string& sku)
        : SyncError("Channel mapping already exists for SKU: " + sku) {}

    bool is_duplicate() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, what());
    }
};

/**
 * Thrown when a (platform, listing) pair is already linked to a mapping.
 */
class DuplicateChannelError : public SyncError {
public:
    DuplicateChannelError(const std::string& platform, const std::string& listing_id)
        : SyncError("Channel entry already exists for " + platform + "/" + listing_id) {}

    bool is_duplicate() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, what());
    }
};

/**
 * Thrown for malformed request fields (empty identifiers, bad config values).
 */
class InvalidArgumentError : public SyncError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : SyncError(message) {}

    bool is_invalid_argument() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * Thrown when a quantity is non-positive where a positive one is required,
 * or outside the supported magnitude.
 */
class InvalidQuantityError : public InvalidArgumentError {
public:
    explicit InvalidQuantityError(const std::string& message)
        : InvalidArgumentError(message) {}
};

/**
 * Thrown by ReconciliationDaemon::start when a loop is already armed.
 */
class DaemonAlreadyRunningError : public SyncError {
public:
    DaemonAlreadyRunningError()
        : SyncError("Sync daemon is already running") {}

    bool is_precondition_failed() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what());
    }
};

/**
 * Thrown when the persisted daemon configuration cannot be parsed.
 * ConfigStore catches it and falls back to defaults.
 */
class ConfigurationError : public SyncError {
public:
    explicit ConfigurationError(const std::string& message)
        : SyncError(message) {}
};

/**
 * Thrown by PublisherClient when the SetQuantity call itself fails.
 */
class PublisherError : public SyncError {
public:
    PublisherError(const std::string& message, grpc::StatusCode status_code)
        : SyncError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_not_found() const override {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, what());
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when the database reports an error.
 */
class StorageError : public SyncError {
public:
    StorageError(const std::string& message, int result_code)
        : SyncError(message), result_code_(result_code) {}

    int result_code() const { return result_code_; }

private:
    int result_code_;
};

/**
 * Thrown when a statement violates a UNIQUE or FOREIGN KEY constraint.
 * Stores translate it into DuplicateSkuError / DuplicateChannelError.
 */
class ConstraintError : public StorageError {
public:
    ConstraintError(const std::string& message, int result_code)
        : StorageError(message, result_code) {}
};

} // namespace stocksync
