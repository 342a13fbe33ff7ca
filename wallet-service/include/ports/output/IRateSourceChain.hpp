#pragma once

#include "IRateSource.hpp"
#include <memory>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Источники курсов в порядке приоритета
 *
 * Реализуется RateSourceFactory.
 */
class IRateSourceChain {
public:
    virtual ~IRateSourceChain() = default;

    virtual std::vector<std::shared_ptr<IRateSource>> sources() = 0;
};

} // namespace wallet::ports::output
