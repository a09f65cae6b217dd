#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace Sift {

/**
 * @brief Opaque capture of a sub-document.
 *
 * Holds the exact bytes the value was decoded from, so it can be stored or
 * forwarded unchanged. An explicit null captures the four bytes `null`; a
 * missing key leaves the capture empty.
 */
class RawMessage {
   public:
    RawMessage() = default;
    explicit RawMessage(std::string bytes) : bytes_{std::move(bytes)} {}

    [[nodiscard]] const std::string& bytes() const noexcept { return bytes_; }
    [[nodiscard]] std::string_view view() const noexcept { return bytes_; }
    [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] bool is_null() const noexcept { return bytes_ == "null"; }

    void assign(std::string_view bytes) { bytes_.assign(bytes); }

    bool operator==(const RawMessage&) const = default;

   private:
    std::string bytes_;
};

}  // namespace Sift
