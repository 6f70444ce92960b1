// Basic types shared by the transfer core, the backend clients and the CLI.
// Keeping these structures simple makes them easy to pass across threads.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace openxfer {

enum class Protocol { Local, Smb, Sftp, Ftp, Cloud };

const char* protocolName(Protocol p);

// Static concurrency bounds per protocol. Network protocols may have their
// effective maximum overridden (see AdmissionController::limitsFor).
struct ProtocolLimits {
    int maxConcurrent = 1;
    int minConcurrent = 1;
};

ProtocolLimits protocolLimits(Protocol p);

// Error taxonomy shared by clients, strategies and the orchestrator.
enum class ErrorKind {
    FileNotFound,
    FileExists,
    PermissionDenied,
    InvalidOperation,
    NetworkError,
    AuthenticationRequired,
    Cancelled,
    InvalidInput,
    StorageFull,
    Unknown
};

const char* errorKindName(ErrorKind k);

// Error reported by a backend client. An empty message means "no error";
// the same convention lets exists() report "does not exist" without an error.
struct ClientError {
    ErrorKind kind = ErrorKind::Unknown;
    std::string message;
    bool timedOut = false;

    bool empty() const { return message.empty(); }
    void clear() {
        kind = ErrorKind::Unknown;
        message.clear();
        timedOut = false;
    }
    void set(ErrorKind k, std::string msg, bool timeout = false) {
        kind = k;
        message = std::move(msg);
        timedOut = timeout;
    }

    static ClientError fromErrno(int e, const std::string& what);
};

// Thrown when a throttled call is refused (exclusive mode) or when a caller
// cancels while waiting for a permit.
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what) : std::runtime_error(what) {}
};

// Thrown by operations that want the admission controller to see a stall.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::string   id;         // provider item id (cloud only)
};

// Callback to answer keyboard-interactive prompts (SFTP).
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

// Resolved connection parameters for one remote endpoint. Produced by a
// CredentialsProvider; the core never persists it.
struct ConnectionDescriptor {
    Protocol protocol = Protocol::Sftp;
    std::string host;
    std::uint16_t port = 0;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;
    std::optional<std::string> workgroup;  // SMB domain

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;
};

// Per-call I/O tuning pushed into clients by the strategies.
struct IoTuning {
    std::chrono::milliseconds timeout{20000};
    std::size_t chunkSize = 64 * 1024;
};

// Progress snapshot delivered to callers.
struct TransferProgress {
    std::uint64_t bytesTransferred = 0;
    std::uint64_t totalBytes = 0;
    std::chrono::milliseconds elapsed{0};
    double fraction = 0.0; // 0..1 across the whole operation
};

using ProgressCB = std::function<void(const TransferProgress&)>;
// Raw byte progress emitted by clients while streaming.
using ByteProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
using CancelCB = std::function<bool()>;

// Per-call control flags shared by every strategy operation.
struct OperationControl {
    CancelCB shouldCancel;
    bool highPriority = false;

    bool cancelled() const { return shouldCancel && shouldCancel(); }
};

} // namespace openxfer
