#ifndef SEQLIST_COMMON_HPP
#define SEQLIST_COMMON_HPP

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>

#ifndef SEQLIST_ENABLE_LOGGING
#define SEQLIST_ENABLE_LOGGING 1
#endif

namespace seqlist {

// compile time switches, set from cmake
constexpr bool LOGGING_ENABLED = SEQLIST_ENABLE_LOGGING != 0;

// signed on purpose, negative indices are rejected rather than wrapped
using index_type = std::int64_t;

// shared, mutable content cell. identity is the address of the managed object.
template<typename T>
using Handle = std::shared_ptr<T>;

template<typename T>
using Result = std::expected<T, std::error_code>;

enum class ListError : int {
    IndexOutOfBounds = 1,
    OperationOnEmptyList,
    ElementNotFound,
    UnexpectedError
};

class ListErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "seqlist"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ListError>(ev)) {
            case ListError::IndexOutOfBounds:
                return "index out of bounds";
            case ListError::OperationOnEmptyList:
                return "operation on empty list";
            case ListError::ElementNotFound:
                return "element not found";
            case ListError::UnexpectedError:
                return "unexpected error: list invariant violated";
        }
        return "unknown list error";
    }
};

[[nodiscard]] inline const std::error_category& list_category() noexcept {
    static const ListErrorCategory category;
    return category;
}

[[nodiscard]] inline std::error_code make_error_code(ListError e) noexcept {
    return {static_cast<int>(e), list_category()};
}

// shorthand for `return fail(ListError::X);` inside Result<T> returning functions
[[nodiscard]] inline std::unexpected<std::error_code> fail(ListError e) noexcept {
    return std::unexpected(make_error_code(e));
}

// identity comparison of two handles, never the stored values
template<typename T>
[[nodiscard]] bool same_handle(const Handle<T>& a, const Handle<T>& b) noexcept {
    return a.get() == b.get();
}

} // namespace seqlist

template<>
struct std::is_error_code_enum<seqlist::ListError> : std::true_type {};

#endif // SEQLIST_COMMON_HPP
