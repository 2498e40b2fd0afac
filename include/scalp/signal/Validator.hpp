#pragma once

#include "scalp/config/ScalpConfig.hpp"
#include "scalp/signal/SignalTypes.hpp"

namespace Scalp {

// 2m confirmation gate. A side is valid only when all five checks hold;
// the state follows the director only when the matching side is valid.
class Validator {
public:
    explicit Validator(const ValidatorConfig& cfg);

    ValidatorResult evaluate(const CandleSeries& bars2m, const CandleSeries& bars1m,
                             const DirectorResult& director) const;

private:
    ValidatorConfig cfg_;
};

} // namespace Scalp
