// Full detection pipeline: candles -> swings -> structure -> zones
#pragma once

#include <vector>

#include "events/types.hpp"
#include "structure/config.hpp"
#include "structure/fvg.hpp"
#include "structure/liquidity.hpp"
#include "structure/market_structure.hpp"
#include "structure/order_blocks.hpp"
#include "structure/premium_discount.hpp"
#include "structure/swings.hpp"
#include "structure/transitions.hpp"
#include "structure/types.hpp"

namespace smc {
namespace structure {

template <typename T>
struct Analysis {
    SwingSet<T> swings;
    std::vector<SwingPoint<T>> classified;
    std::vector<StructureEvent<T>> structure;
    std::vector<OrderBlock<T>> order_blocks;
    std::vector<FairValueGap<T>> fvgs;
    std::vector<LiquidityZone<T>> liquidity;
    std::vector<PremiumDiscountZone<T>> premium_discount;
    Bias bias{Bias::Neutral};
};

// Run every stage in dependency order. cfg is taken by value so timeframe
// defaults can be filled in; it is validated before any detector runs.
template <typename T>
Analysis<T> analyze(const std::vector<Candle>& candles,
                    AnalysisConfig<T> cfg,
                    const std::vector<Candle>* ltf_candles = nullptr,
                    TransitionLogger<T>* log = nullptr) {
    cfg.apply_timeframe_defaults();
    cfg.validate();

    const SwingDetector<T> swings(cfg.lookback_left, cfg.lookback_right);
    const MarketStructureDetector<T> ms(cfg.break_mode, cfg.choch_confirmation_candles);
    const FVGDetector<T> fvg(cfg.fvg_min_gap_size, cfg.use_auto_threshold, cfg.atr_period, cfg.fvg_atr_multiplier);
    const LiquidityDetector<T> liq(cfg.sweep_threshold_multiplier, cfg.eqh_eql_threshold_multiplier,
                                   cfg.sessions, cfg.atr_period, cfg.session_utc_offset_s);
    const OrderBlockDetector<T> obd(cfg.ob_lookback_window, cfg.ob_min_range_atr, cfg.atr_period);

    Analysis<T> out;
    out.swings = swings.detect(candles);
    out.classified = SwingDetector<T>::classify(out.swings);
    out.structure = ms.detect(candles, out.classified);
    out.bias = current_bias(out.structure);

    out.fvgs = fvg.update_mitigation(candles, fvg.detect(candles), log);
    out.liquidity = liq.detect(candles, out.swings.highs, out.swings.lows,
                               cfg.include_fvg_liquidity ? &out.fvgs : nullptr, log);

    out.order_blocks = obd.update_states(candles, obd.detect(candles, out.structure, ltf_candles, &out.liquidity), log);
    out.premium_discount = PremiumDiscountDetector<T>::detect(candles, out.swings.highs, out.swings.lows,
                                                              cfg.equilibrium_band);
    return out;
}

} // namespace structure
} // namespace smc
