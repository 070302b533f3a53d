#include "riskgate/risk/risk_limit_registry.hpp"
#include "riskgate/time/time_utils.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace riskgate {

using domain::Decimal;
using domain::ErrorCode;

namespace {

const Decimal kHundred{100};

domain::Rejection reject(ErrorCode code, const std::string& message,
                         Decimal observed, Decimal limit) {
  domain::Rejection r;
  r.code = code;
  r.message = message;
  r.observed = observed;
  r.limit = limit;
  return r;
}

Decimal signedQuantity(domain::Side side, Decimal quantity) {
  return side == domain::Side::Buy ? quantity : -quantity;
}

// part * 100 / whole, saturating at Decimal::largest(). Only used to report a
// breach; the breach itself is decided exactly.
Decimal percentOf(Decimal part, Decimal whole) {
  if (auto scaled = Decimal::tryMultiply(part, kHundred)) {
    if (auto pct = Decimal::tryDivide(*scaled, whole)) {
      return *pct;
    }
  }
  // part * 100 does not fit; divide first and accept the coarser rounding.
  if (auto ratio = Decimal::tryDivide(part, whole)) {
    if (auto pct = Decimal::tryMultiply(*ratio, kHundred)) {
      return *pct;
    }
  }
  return Decimal::largest();
}

// quantity * price * 100 > pct * portfolio, exact for any inputs. When
// quantity * price itself does not fit, the position value exceeds every
// representable portfolio value, so any pct below 100 is breached.
bool positionValueExceeds(Decimal quantity, Decimal price, Decimal pct,
                          Decimal portfolio) {
  auto value = Decimal::tryMultiply(quantity, price);
  if (!value) {
    return true;
  }
  return Decimal::compareProducts(*value, kHundred, pct, portfolio) > 0;
}

// |v|, clamped to the Decimal range.
Decimal magnitude(Decimal v) {
  if (!v.isNegative()) {
    return v;
  }
  auto negated = Decimal::trySubtract(Decimal{}, v);
  return negated ? *negated : Decimal::largest();
}

// a + b, clamped to the Decimal range.
Decimal addSaturating(Decimal a, Decimal b) {
  if (auto sum = Decimal::tryAdd(a, b)) {
    return *sum;
  }
  return b.isNegative() ? -Decimal::largest() : Decimal::largest();
}

}  // namespace

bool operator==(const Reservation& a, const Reservation& b) {
  return std::tie(a.order_id, a.strategy_id, a.symbol, a.side, a.quantity,
                  a.notional) ==
         std::tie(b.order_id, b.strategy_id, b.symbol, b.side, b.quantity,
                  b.notional);
}

bool operator==(const RegistrySnapshot::Instrument& a,
                const RegistrySnapshot::Instrument& b) {
  return std::tie(a.position, a.pending_buy, a.pending_sell) ==
         std::tie(b.position, b.pending_buy, b.pending_sell);
}

bool operator==(const RegistrySnapshot::Strategy& a,
                const RegistrySnapshot::Strategy& b) {
  return std::tie(a.net_quantity, a.reserved_notional) ==
         std::tie(b.net_quantity, b.reserved_notional);
}

bool operator==(const RegistrySnapshot& a, const RegistrySnapshot& b) {
  return std::tie(a.instruments, a.strategies, a.reservations, a.marks,
                  a.has_portfolio_mark, a.portfolio_value, a.peak_value,
                  a.window_index, a.daily_pnl, a.day_index) ==
         std::tie(b.instruments, b.strategies, b.reservations, b.marks,
                  b.has_portfolio_mark, b.portfolio_value, b.peak_value,
                  b.window_index, b.daily_pnl, b.day_index);
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskLimitRegistry::RiskLimitRegistry(const domain::RiskLimits& limits,
                                     const ITimeProvider& clock)
    : limits_(limits), clock_(clock) {
  day_index_ = currentDay();
  window_index_ = currentWindow();
}

std::int64_t RiskLimitRegistry::currentDay() const {
  return tradingDayIndex(clock_.now_ms(), limits_.day_rollover_hour_utc);
}

std::int64_t RiskLimitRegistry::currentWindow() const {
  return drawdownWindowIndex(clock_.now_ms(), limits_.day_rollover_hour_utc,
                             limits_.drawdown_window_days);
}

// -----------------------------------------------------------------------------
// Slot lookup: shared lock for the common hit, exclusive lock to insert
// -----------------------------------------------------------------------------
RiskLimitRegistry::InstrumentSlot& RiskLimitRegistry::instrumentSlot(
    const std::string& symbol) {
  {
    std::shared_lock lock(slots_mutex_);
    auto it = instruments_.find(symbol);
    if (it != instruments_.end()) {
      return *it->second;
    }
  }
  std::unique_lock lock(slots_mutex_);
  auto& slot = instruments_[symbol];
  if (!slot) {
    slot = std::make_unique<InstrumentSlot>();
    slot->position.symbol = symbol;
  }
  return *slot;
}

RiskLimitRegistry::StrategySlot& RiskLimitRegistry::strategySlot(
    const std::string& strategy_id) {
  {
    std::shared_lock lock(slots_mutex_);
    auto it = strategies_.find(strategy_id);
    if (it != strategies_.end()) {
      return *it->second;
    }
  }
  std::unique_lock lock(slots_mutex_);
  auto& slot = strategies_[strategy_id];
  if (!slot) {
    slot = std::make_unique<StrategySlot>();
  }
  return *slot;
}

RiskLimitRegistry::InstrumentSlot* RiskLimitRegistry::findInstrument(
    const std::string& symbol) const {
  std::shared_lock lock(slots_mutex_);
  auto it = instruments_.find(symbol);
  return it != instruments_.end() ? it->second.get() : nullptr;
}

RiskLimitRegistry::StrategySlot* RiskLimitRegistry::findStrategy(
    const std::string& strategy_id) const {
  std::shared_lock lock(slots_mutex_);
  auto it = strategies_.find(strategy_id);
  return it != strategies_.end() ? it->second.get() : nullptr;
}

std::size_t RiskLimitRegistry::instrumentSlotCount() const {
  std::shared_lock lock(slots_mutex_);
  return instruments_.size();
}

std::size_t RiskLimitRegistry::strategySlotCount() const {
  std::shared_lock lock(slots_mutex_);
  return strategies_.size();
}

// -----------------------------------------------------------------------------
// check: evaluate under both slot locks, reserve on acceptance
// -----------------------------------------------------------------------------
domain::CheckResult RiskLimitRegistry::check(const domain::Order& order,
                                             const std::string& strategy_id) {
  InstrumentSlot* instrument = findInstrument(order.symbol);
  StrategySlot* strategy = findStrategy(strategy_id);
  if (instrument != nullptr && strategy != nullptr) {
    std::scoped_lock slot_lock(instrument->mutex, strategy->mutex);
    return evaluateAndReserve(order, strategy_id, *instrument, *strategy);
  }

  // A key not tracked yet. Decide with the table held exclusively, so no
  // other admission can create the same slot meanwhile, and publish the new
  // slots only if the order is accepted.
  std::unique_lock table_lock(slots_mutex_);

  std::unique_ptr<InstrumentSlot> new_instrument;
  if (auto it = instruments_.find(order.symbol); it != instruments_.end()) {
    instrument = it->second.get();
  } else {
    new_instrument = std::make_unique<InstrumentSlot>();
    new_instrument->position.symbol = order.symbol;
    instrument = new_instrument.get();
  }

  std::unique_ptr<StrategySlot> new_strategy;
  if (auto it = strategies_.find(strategy_id); it != strategies_.end()) {
    strategy = it->second.get();
  } else {
    new_strategy = std::make_unique<StrategySlot>();
    strategy = new_strategy.get();
  }

  std::scoped_lock slot_lock(instrument->mutex, strategy->mutex);
  domain::CheckResult result =
      evaluateAndReserve(order, strategy_id, *instrument, *strategy);
  if (!result) {
    if (new_instrument) {
      instruments_.emplace(order.symbol, std::move(new_instrument));
    }
    if (new_strategy) {
      strategies_.emplace(strategy_id, std::move(new_strategy));
    }
  }
  return result;
}

domain::CheckResult RiskLimitRegistry::evaluateAndReserve(
    const domain::Order& order, const std::string& strategy_id,
    InstrumentSlot& instrument, StrategySlot& strategy) {
  {
    std::lock_guard lock(reservations_mutex_);
    if (reservations_.count(order.id) != 0) {
      domain::Rejection r;
      r.code = ErrorCode::DuplicateOrderId;
      r.message = "order id " + order.id + " already holds a reservation";
      return r;
    }
  }

  Reservation reservation;
  Decimal pending_after;
  Decimal reserved_after;
  try {
    domain::CheckResult result =
        evaluate(order, strategy_id, instrument, strategy);
    if (result) {
      return result;
    }

    reservation.order_id = order.id;
    reservation.strategy_id = strategy_id;
    reservation.symbol = order.symbol;
    reservation.side = order.side;
    reservation.quantity = order.quantity;
    reservation.notional = order.notional();

    pending_after = (order.side == domain::Side::Buy ? instrument.pending_buy
                                                     : instrument.pending_sell) +
                    order.quantity;
    reserved_after = strategy.reserved_notional + reservation.notional;
  } catch (const std::overflow_error& e) {
    return reject(ErrorCode::InvalidOrder,
                  std::string("order is outside the representable range: ") +
                      e.what(),
                  order.quantity, Decimal{});
  }

  if (order.side == domain::Side::Buy) {
    instrument.pending_buy = pending_after;
  } else {
    instrument.pending_sell = pending_after;
  }
  strategy.reserved_notional = reserved_after;

  std::lock_guard lock(reservations_mutex_);
  reservations_.emplace(order.id, std::move(reservation));
  return std::nullopt;
}

domain::CheckResult RiskLimitRegistry::evaluate(const domain::Order& order,
                                                const std::string& strategy_id,
                                                const InstrumentSlot& instrument,
                                                const StrategySlot& strategy) {
  // --- 1. Max order quantity ------------------------------------------------
  Decimal max_qty = limits_.default_max_order_quantity;
  if (auto it = limits_.max_order_quantity.find(order.symbol);
      it != limits_.max_order_quantity.end()) {
    max_qty = it->second;
  }
  if (order.quantity > max_qty) {
    std::ostringstream msg;
    msg << "order quantity " << order.quantity << " exceeds max order quantity "
        << max_qty << " for " << order.symbol;
    return reject(ErrorCode::MaxOrderQuantityExceeded, msg.str(),
                  order.quantity, max_qty);
  }

  // --- 2. Position limit ----------------------------------------------------
  const Decimal net = instrument.position.net_quantity;
  const Decimal projected = order.side == domain::Side::Buy
                                ? net + instrument.pending_buy + order.quantity
                                : net - instrument.pending_sell - order.quantity;

  auto limit_it = limits_.position_limits.find(order.symbol);
  if (limit_it == limits_.position_limits.end()) {
    if (limits_.reject_unknown_instruments) {
      return reject(ErrorCode::UnknownInstrument,
                    "no position limit configured for " + order.symbol,
                    projected.abs(), Decimal{});
    }
    warnUnknownInstrument(order.symbol);
  } else if (projected.abs() > limit_it->second) {
    std::ostringstream msg;
    msg << "projected position " << projected << " in " << order.symbol
        << " exceeds position limit " << limit_it->second;
    return reject(ErrorCode::PositionLimitExceeded, msg.str(), projected.abs(),
                  limit_it->second);
  }

  std::shared_lock portfolio_lock(portfolio_mutex_);

  // --- 3. Position value as a share of the portfolio ------------------------
  // value / portfolio > pct / 100  <=>  |projected| * price * 100
  //                                     > pct * portfolio
  if (has_portfolio_mark_ && portfolio_value_.isPositive() &&
      limits_.max_position_value_pct.isPositive()) {
    const bool breached =
        positionValueExceeds(projected.abs(), order.price,
                             limits_.max_position_value_pct, portfolio_value_);
    if (breached) {
      auto value = Decimal::tryMultiply(projected.abs(), order.price);
      Decimal pct = value ? percentOf(*value, portfolio_value_)
                          : Decimal::largest();
      std::ostringstream msg;
      msg << "position value "
          << (value ? value->toString() : std::string("(out of range)"))
          << " in " << order.symbol << " is " << pct
          << "% of portfolio value " << portfolio_value_ << ", limit "
          << limits_.max_position_value_pct << "%";
      return reject(ErrorCode::PortfolioValueLimitExceeded, msg.str(), pct,
                    limits_.max_position_value_pct);
    }
  }

  // --- 4. Drawdown circuit breaker ------------------------------------------
  // (peak - value) / peak > pct / 100  <=>  (peak - value) * 100 > pct * peak
  if (has_portfolio_mark_ && peak_value_.isPositive() &&
      limits_.max_drawdown_pct.isPositive() &&
      window_index_ == currentWindow()) {
    const Decimal decline = peak_value_ - portfolio_value_;
    if (Decimal::compareProducts(decline, kHundred, limits_.max_drawdown_pct,
                                 peak_value_) > 0) {
      Decimal drawdown = percentOf(decline, peak_value_);
      std::ostringstream msg;
      msg << "drawdown " << drawdown << "% exceeds max drawdown "
          << limits_.max_drawdown_pct << "%";
      return reject(ErrorCode::DrawdownBreached, msg.str(), drawdown,
                    limits_.max_drawdown_pct);
    }
  }

  // --- 5. Daily loss ----------------------------------------------------------
  if (limits_.max_daily_loss.isPositive() && day_index_ == currentDay()) {
    Decimal loss = -daily_pnl_;
    if (loss >= limits_.max_daily_loss) {
      std::ostringstream msg;
      msg << "daily loss " << loss << " has reached max daily loss "
          << limits_.max_daily_loss;
      return reject(ErrorCode::DailyLossBreached, msg.str(), loss,
                    limits_.max_daily_loss);
    }
  }

  // --- 6. Strategy exposure ---------------------------------------------------
  if (auto it = limits_.strategy_exposure_limits.find(strategy_id);
      it != limits_.strategy_exposure_limits.end()) {
    std::optional<Decimal> exposure = Decimal::tryAdd(
        committedExposure(strategy), strategy.reserved_notional);
    if (exposure) {
      exposure = Decimal::tryAdd(*exposure, order.notional());
    }
    if (!exposure || *exposure > it->second) {
      Decimal observed = exposure ? *exposure : Decimal::largest();
      std::ostringstream msg;
      msg << "exposure " << observed << " of strategy " << strategy_id
          << " exceeds limit " << it->second;
      return reject(ErrorCode::StrategyExposureExceeded, msg.str(), observed,
                    it->second);
    }
  }

  return std::nullopt;
}

Decimal RiskLimitRegistry::committedExposure(const StrategySlot& strategy) const {
  Decimal total;
  for (const auto& [symbol, qty] : strategy.net_quantity) {
    auto mark = marks_.find(symbol);
    if (mark != marks_.end()) {
      auto value = Decimal::tryMultiply(qty, mark->second);
      total = value ? addSaturating(total, magnitude(*value))
                    : Decimal::largest();
    }
  }
  return total;
}

void RiskLimitRegistry::warnUnknownInstrument(const std::string& symbol) {
  std::lock_guard lock(warned_mutex_);
  if (warned_symbols_.insert(symbol).second) {
    std::cerr << "[RiskLimitRegistry] WARNING: no position limit configured "
                 "for " << symbol << "; admitting uncapped.\n";
  }
}

// -----------------------------------------------------------------------------
// commit: reservation → committed fill
// -----------------------------------------------------------------------------
bool RiskLimitRegistry::commit(const domain::OrderId& order_id,
                               Decimal executed_price,
                               Decimal commission) {
  Reservation reservation;
  {
    std::lock_guard lock(reservations_mutex_);
    auto it = reservations_.find(order_id);
    if (it == reservations_.end()) {
      return false;
    }
    reservation = it->second;
  }

  InstrumentSlot& instrument = instrumentSlot(reservation.symbol);
  StrategySlot& strategy = strategySlot(reservation.strategy_id);
  std::scoped_lock slot_lock(instrument.mutex, strategy.mutex);

  {
    // A concurrent commit or rollback may have settled it meanwhile.
    std::lock_guard lock(reservations_mutex_);
    if (reservations_.count(order_id) == 0) {
      return false;
    }
  }

  // Everything that can overflow is computed on copies first; a throw leaves
  // the slots and the reservation as they were.
  const Decimal signed_qty =
      signedQuantity(reservation.side, reservation.quantity);
  domain::Position position = instrument.position;
  applyFill(position, signed_qty, executed_price);
  const Decimal realized_delta =
      position.realized_pnl - instrument.position.realized_pnl;

  Decimal strategy_net = signed_qty;
  if (auto it = strategy.net_quantity.find(reservation.symbol);
      it != strategy.net_quantity.end()) {
    strategy_net = it->second + signed_qty;
  }
  const Decimal pnl_delta = realized_delta - commission;

  {
    std::lock_guard lock(reservations_mutex_);
    reservations_.erase(order_id);
  }

  if (reservation.side == domain::Side::Buy) {
    instrument.pending_buy -= reservation.quantity;
  } else {
    instrument.pending_sell -= reservation.quantity;
  }
  strategy.reserved_notional -= reservation.notional;
  instrument.position = position;

  if (strategy_net.isZero()) {
    strategy.net_quantity.erase(reservation.symbol);
  } else {
    strategy.net_quantity[reservation.symbol] = strategy_net;
  }

  std::unique_lock portfolio_lock(portfolio_mutex_);
  marks_[reservation.symbol] = executed_price;
  rollDayIfNeeded(currentDay());
  daily_pnl_ = addSaturating(daily_pnl_, pnl_delta);
  return true;
}

// -----------------------------------------------------------------------------
// rollback: release a reservation without a fill
// -----------------------------------------------------------------------------
bool RiskLimitRegistry::rollback(const domain::OrderId& order_id) {
  Reservation reservation;
  {
    std::lock_guard lock(reservations_mutex_);
    auto it = reservations_.find(order_id);
    if (it == reservations_.end()) {
      return false;
    }
    reservation = it->second;
  }

  InstrumentSlot& instrument = instrumentSlot(reservation.symbol);
  StrategySlot& strategy = strategySlot(reservation.strategy_id);
  std::scoped_lock slot_lock(instrument.mutex, strategy.mutex);

  {
    std::lock_guard lock(reservations_mutex_);
    if (reservations_.erase(order_id) == 0) {
      return false;
    }
  }

  if (reservation.side == domain::Side::Buy) {
    instrument.pending_buy -= reservation.quantity;
  } else {
    instrument.pending_sell -= reservation.quantity;
  }
  strategy.reserved_notional -= reservation.notional;
  return true;
}

// -----------------------------------------------------------------------------
// applyFill: weighted average entry and realized PnL
// -----------------------------------------------------------------------------
void RiskLimitRegistry::applyFill(domain::Position& pos,
                                  Decimal signed_fill_qty,
                                  Decimal fill_price) {
  const Decimal current_qty = pos.net_quantity;

  // Flat: the fill opens a fresh position.
  if (current_qty.isZero()) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
    return;
  }

  bool same_direction = current_qty.isPositive() == signed_fill_qty.isPositive();

  if (same_direction) {
    // Increasing. Both quantities share a sign, so the total is non-zero.
    Decimal new_total = current_qty + signed_fill_qty;
    pos.average_price = (current_qty * pos.average_price +
                         signed_fill_qty * fill_price) / new_total;
    pos.net_quantity = new_total;
    return;
  }

  const Decimal abs_current = current_qty.abs();
  const Decimal abs_fill = signed_fill_qty.abs();

  // Long close: closed * (fill - avg). Short close: closed * (avg - fill).
  const Decimal direction{current_qty.isPositive() ? 1 : -1};

  if (abs_fill <= abs_current) {
    // Decreasing; average price unchanged.
    pos.realized_pnl += abs_fill * (fill_price - pos.average_price) * direction;
    pos.net_quantity = current_qty + signed_fill_qty;
    if (pos.net_quantity.isZero()) {
      pos.average_price = Decimal{};
    }
    return;
  }

  // Reversal: close everything, open the remainder at the fill price.
  pos.realized_pnl += abs_current * (fill_price - pos.average_price) * direction;
  pos.net_quantity = current_qty + signed_fill_qty;
  pos.average_price = fill_price;
}

// -----------------------------------------------------------------------------
// Settlement inputs
// -----------------------------------------------------------------------------
void RiskLimitRegistry::hydratePosition(const domain::Position& position) {
  InstrumentSlot& instrument = instrumentSlot(position.symbol);
  {
    std::lock_guard lock(instrument.mutex);
    instrument.position = position;
  }

  std::unique_lock portfolio_lock(portfolio_mutex_);
  if (!position.net_quantity.isZero() && position.average_price.isPositive()) {
    marks_.emplace(position.symbol, position.average_price);
  }
}

void RiskLimitRegistry::rollDayIfNeeded(std::int64_t day_index) {
  if (day_index != day_index_) {
    day_index_ = day_index;
    daily_pnl_ = Decimal{};
  }
}

void RiskLimitRegistry::recordRealizedPnl(Decimal amount) {
  std::unique_lock lock(portfolio_mutex_);
  rollDayIfNeeded(currentDay());
  daily_pnl_ = addSaturating(daily_pnl_, amount);
}

void RiskLimitRegistry::markPortfolio(Decimal value) {
  std::unique_lock lock(portfolio_mutex_);
  const std::int64_t window = currentWindow();

  if (!has_portfolio_mark_ || window != window_index_) {
    window_index_ = window;
    peak_value_ = value;
  } else {
    peak_value_ = domain::max(peak_value_, value);
  }
  portfolio_value_ = value;
  has_portfolio_mark_ = true;
}

void RiskLimitRegistry::markPrice(const std::string& symbol, Decimal price) {
  std::unique_lock lock(portfolio_mutex_);
  marks_[symbol] = price;
}

// -----------------------------------------------------------------------------
// Read-side accessors
// -----------------------------------------------------------------------------
std::optional<domain::Position> RiskLimitRegistry::position(
    const std::string& symbol) const {
  const InstrumentSlot* slot = nullptr;
  {
    std::shared_lock lock(slots_mutex_);
    auto it = instruments_.find(symbol);
    if (it == instruments_.end()) {
      return std::nullopt;
    }
    slot = it->second.get();
  }
  std::lock_guard lock(slot->mutex);
  return slot->position;
}

std::vector<domain::Position> RiskLimitRegistry::positions() const {
  std::vector<const InstrumentSlot*> slots;
  {
    std::shared_lock lock(slots_mutex_);
    slots.reserve(instruments_.size());
    for (const auto& [symbol, slot] : instruments_) {
      slots.push_back(slot.get());
    }
  }

  std::vector<domain::Position> result;
  result.reserve(slots.size());
  for (const InstrumentSlot* slot : slots) {
    std::lock_guard lock(slot->mutex);
    if (!slot->position.net_quantity.isZero() ||
        !slot->position.realized_pnl.isZero()) {
      result.push_back(slot->position);
    }
  }
  return result;
}

Decimal RiskLimitRegistry::strategyExposure(const std::string& strategy_id) const {
  const StrategySlot* slot = nullptr;
  {
    std::shared_lock lock(slots_mutex_);
    auto it = strategies_.find(strategy_id);
    if (it == strategies_.end()) {
      return Decimal{};
    }
    slot = it->second.get();
  }
  std::lock_guard lock(slot->mutex);
  std::shared_lock portfolio_lock(portfolio_mutex_);
  return addSaturating(committedExposure(*slot), slot->reserved_notional);
}

RiskSummary RiskLimitRegistry::summary() const {
  std::vector<domain::Position> held = positions();

  std::size_t open = 0;
  {
    std::lock_guard lock(reservations_mutex_);
    open = reservations_.size();
  }

  RiskSummary s;
  s.open_reservations = open;

  std::shared_lock lock(portfolio_mutex_);
  for (const domain::Position& pos : held) {
    auto mark = marks_.find(pos.symbol);
    Decimal price = mark != marks_.end() ? mark->second : pos.average_price;
    auto product = Decimal::tryMultiply(pos.net_quantity, price);
    Decimal value = product ? *product
                  : pos.net_quantity.isPositive() ? Decimal::largest()
                                                  : -Decimal::largest();

    s.gross_exposure = addSaturating(s.gross_exposure, magnitude(value));
    s.net_exposure = addSaturating(s.net_exposure, value);
    if (value.isPositive()) {
      s.long_exposure = addSaturating(s.long_exposure, value);
    } else {
      s.short_exposure = addSaturating(s.short_exposure, value);
    }
  }

  s.portfolio_value = portfolio_value_;
  s.peak_value = peak_value_;
  if (has_portfolio_mark_ && peak_value_.isPositive()) {
    s.drawdown_pct = percentOf(peak_value_ - portfolio_value_, peak_value_);
  }
  s.daily_pnl = day_index_ == currentDay() ? daily_pnl_ : Decimal{};
  return s;
}

// -----------------------------------------------------------------------------
// snapshot: consistent copy of every non-empty entry
// -----------------------------------------------------------------------------
RegistrySnapshot RiskLimitRegistry::snapshot() const {
  RegistrySnapshot snap;

  // Hold the slot table exclusively so no slot is created or locked by a
  // new admission while the copy is taken.
  std::unique_lock slots_lock(slots_mutex_);

  for (const auto& [symbol, slot] : instruments_) {
    std::lock_guard lock(slot->mutex);
    const domain::Position& pos = slot->position;
    if (pos.net_quantity.isZero() && pos.average_price.isZero() &&
        pos.realized_pnl.isZero() && slot->pending_buy.isZero() &&
        slot->pending_sell.isZero()) {
      continue;
    }
    snap.instruments[symbol] =
        RegistrySnapshot::Instrument{pos, slot->pending_buy, slot->pending_sell};
  }

  for (const auto& [id, slot] : strategies_) {
    std::lock_guard lock(slot->mutex);
    if (slot->net_quantity.empty() && slot->reserved_notional.isZero()) {
      continue;
    }
    RegistrySnapshot::Strategy& s = snap.strategies[id];
    s.net_quantity.insert(slot->net_quantity.begin(), slot->net_quantity.end());
    s.reserved_notional = slot->reserved_notional;
  }

  {
    std::lock_guard lock(reservations_mutex_);
    snap.reservations.insert(reservations_.begin(), reservations_.end());
  }

  std::shared_lock portfolio_lock(portfolio_mutex_);
  snap.marks.insert(marks_.begin(), marks_.end());
  snap.has_portfolio_mark = has_portfolio_mark_;
  snap.portfolio_value = portfolio_value_;
  snap.peak_value = peak_value_;
  snap.window_index = window_index_;
  snap.daily_pnl = daily_pnl_;
  snap.day_index = day_index_;
  return snap;
}

}  // namespace riskgate
