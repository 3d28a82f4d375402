#pragma once

#include <string>

namespace stratbench {

/// Strategy output for one bar.
enum class Signal { Buy, Sell, Hold };

enum class TradeAction { Buy, Sell };

/// Why a trade was executed.
enum class TradeReason { Signal, StopLoss };

inline const char* toString(Signal s) {
    switch (s) {
        case Signal::Buy: return "BUY";
        case Signal::Sell: return "SELL";
        case Signal::Hold: return "HOLD";
    }
    return "?";
}

inline const char* toString(TradeAction a) {
    return a == TradeAction::Buy ? "BUY" : "SELL";
}

inline const char* toString(TradeReason r) {
    return r == TradeReason::StopLoss ? "stop_loss" : "signal";
}

} // namespace stratbench
