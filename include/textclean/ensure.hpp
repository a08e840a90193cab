#pragma once

#include <utility>

#include "util/compiler_attribute.hpp"

namespace textclean {

class Ensure {
  public:
    explicit Ensure(bool condition) : m_condition(condition) {}

    template <typename Error>
    TEXTCLEAN_ALWAYSINLINE auto or_throw(Error&& error) {
        if (not m_condition) {
            throw std::forward<Error>(error);
        }
    }

  private:
    bool m_condition;
};

[[nodiscard]] inline auto ensure(bool condition) -> Ensure {
    return Ensure(condition);
}

}  // namespace textclean
