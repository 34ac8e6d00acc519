#ifndef ARBOR_CORE_UTILITIES_HPP
#define ARBOR_CORE_UTILITIES_HPP

#include <memory>
#include <type_traits>
#include <utility>

#include <boost/lexical_cast.hpp>

#include <arbor/core/exception.hpp>

namespace arbor {

using boost::lexical_cast;

// function_view<R(Args...)> refers to a callable without owning it.
// It's meant for passing callbacks down a call stack, so the callable must
// outlive the view.
template<class Signature>
class function_view;
template<class Return, class... Args>
class function_view<Return(Args...)>
{
 public:
    template<class Callable>
    function_view(Callable&& callable) noexcept
        : callable_(const_cast<void*>(
            static_cast<void const*>(std::addressof(callable))))
    {
        invoker_ = [](void* callable, Args... args) -> Return {
            return (*static_cast<std::remove_reference_t<Callable>*>(
                callable))(std::forward<Args>(args)...);
        };
    }

    Return
    operator()(Args... args) const
    {
        return invoker_(callable_, std::forward<Args>(args)...);
    }

 private:
    void* callable_;
    Return (*invoker_)(void*, Args...);
};

} // namespace arbor

#endif
