#pragma once

#include <stdexcept>
#include <string>

namespace bulkdl {

// Invalid task-source or command-line parameters. Fatal, raised before any download starts.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Base of every error confined to a single task.
class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Request or body-stream failure.
class TransferError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Destination file could not be created or written.
class PersistenceError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace bulkdl
