#pragma once

#include <hdf5.h>

#include <string>
#include <utility>

namespace mpkit {
namespace io {
namespace detail {

/**
 * @brief Owning wrapper around an HDF5 identifier.
 *
 * Closes the identifier with the matching H5*close function on
 * destruction. Move-only.
 */
class Handle {
public:
    using Closer = herr_t (*)(hid_t);

    Handle() = default;
    Handle(hid_t id, Closer closer) : id_(id), closer_(closer) {}
    ~Handle() { reset(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    Handle(Handle&& other) noexcept
        : id_(std::exchange(other.id_, H5I_INVALID_HID)), closer_(other.closer_) {}

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            id_ = std::exchange(other.id_, H5I_INVALID_HID);
            closer_ = other.closer_;
        }
        return *this;
    }

    void reset() noexcept {
        if (id_ >= 0 && closer_) {
            closer_(id_);
        }
        id_ = H5I_INVALID_HID;
    }

    [[nodiscard]] hid_t get() const noexcept { return id_; }
    explicit operator bool() const noexcept { return id_ >= 0; }

private:
    hid_t id_ = H5I_INVALID_HID;
    Closer closer_ = nullptr;
};

inline Handle fileHandle(hid_t id) { return Handle(id, H5Fclose); }
inline Handle objectHandle(hid_t id) { return Handle(id, H5Oclose); }
inline Handle datasetHandle(hid_t id) { return Handle(id, H5Dclose); }
inline Handle attributeHandle(hid_t id) { return Handle(id, H5Aclose); }
inline Handle typeHandle(hid_t id) { return Handle(id, H5Tclose); }
inline Handle spaceHandle(hid_t id) { return Handle(id, H5Sclose); }
inline Handle plistHandle(hid_t id) { return Handle(id, H5Pclose); }

/**
 * @brief Disables HDF5's automatic error-stack printing for a scope.
 *
 * Failures are reported through mpkit exceptions instead; the previous
 * handler is restored on exit.
 */
class ErrorStackGuard {
public:
    ErrorStackGuard() {
        H5Eget_auto2(H5E_DEFAULT, &old_func_, &old_data_);
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }
    ~ErrorStackGuard() { H5Eset_auto2(H5E_DEFAULT, old_func_, old_data_); }

    ErrorStackGuard(const ErrorStackGuard&) = delete;
    ErrorStackGuard& operator=(const ErrorStackGuard&) = delete;

private:
    H5E_auto2_t old_func_ = nullptr;
    void* old_data_ = nullptr;
};

/**
 * @brief Most specific message on the current HDF5 error stack.
 *
 * Clears the stack. Returns an empty string when the stack is empty.
 */
std::string lastHdf5Error();

/// "context: hdf5 message" (or just context when the stack is empty)
inline std::string describeFailure(const std::string& context) {
    std::string detail = lastHdf5Error();
    return detail.empty() ? context : context + ": " + detail;
}

} // namespace detail
} // namespace io
} // namespace mpkit
