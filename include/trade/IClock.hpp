#pragma once
#include "trade/Types.hpp"

namespace trade {

class IClock {
public:
    virtual TimePoint now() const = 0;
    virtual ~IClock() = default;
};

}
