#pragma once

#include <memory>
#include <type_traits>
#include <utility>

namespace wheatgrass {

// ---------------------------------------------------------------
// provider<T>: deferred supplier of T
// ---------------------------------------------------------------

/// Lazy supplier of T.  Every call to get() may produce a fresh value;
/// the injector never caches what a provider returns.
template <typename T>
class provider {
public:
    using value_type = T;

    virtual ~provider() = default;

    virtual std::shared_ptr<T> get() = 0;
};

/// provider<T> backed by a callable returning `std::shared_ptr<T>` or `T`.
template <typename T, typename F>
class function_provider final : public provider<T> {
public:
    explicit function_provider(F fn) : fn_(std::move(fn)) {}

    std::shared_ptr<T> get() override {
        if constexpr (std::is_convertible_v<std::invoke_result_t<F&>, std::shared_ptr<T>>) {
            return fn_();
        } else {
            return std::make_shared<T>(fn_());
        }
    }

private:
    F fn_;
};

template <typename T, typename F>
std::shared_ptr<provider<T>> make_provider(F&& fn) {
    return std::make_shared<function_provider<T, std::decay_t<F>>>(std::forward<F>(fn));
}

} // namespace wheatgrass
