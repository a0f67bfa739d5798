// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <samcxx/clock.hpp>

namespace samcxx {
namespace clock {

namespace {

constexpr hw::master_select
css_for (source_id sid)
{
  switch (sid) {
    case source_id::slow:
      return hw::master_select::slow;
    case source_id::plla:
      return hw::master_select::plla;
    case source_id::upll:
      return hw::master_select::upll;
    default:
      break;
  }
  return hw::master_select::main;
}

constexpr bool
css_is_pll (hw::master_select css)
{
  return (hw::master_select::plla == css) || (hw::master_select::upll == css);
}

/* Fast RC oscillator supports exactly three frequencies. */
constexpr bool
valid_rc_Hz (unsigned int freq_Hz)
{
  return (4'000'000 == freq_Hz)
    || (8'000'000 == freq_Hz)
    || (12'000'000 == freq_Hz);
}

} // ns anonymous

model::model (const variant_type& variant) :
  variant_{variant},
  sources_{{
      {source_id::slow, SlowRC_Hz, SlowXtal_Hz, ready_flag(source_id::slow)},
      {source_id::main_rc, 4'000'000, 12'000'000, ready_flag(source_id::main_rc)},
      {source_id::main_xtal, variant.main_xtal_min_Hz, variant.main_xtal_max_Hz,
       ready_flag(source_id::main_xtal)},
      {source_id::main_bypass, variant.main_bypass_min_Hz, variant.main_bypass_max_Hz,
       ready_flag(source_id::main_bypass)},
      {source_id::plla, variant.plla_out_min_Hz, variant.plla_out_max_Hz,
       ready_flag(source_id::plla)},
      {source_id::upll, variant.upll_ref_Hz * variant.upll_mul, variant.upll_ref_Hz * variant.upll_mul,
       ready_flag(source_id::upll)},
    }}
{ }

const source*
model::find (source_id sid) const
{
  auto idx = static_cast<unsigned int>(sid);
  if ((source_count <= idx)
      || (!variant_.has_source(sid))) {
    return nullptr;
  }
  return &sources_[idx];
}

int
model::validate (const tree_config& config,
                 validated_config& validated) const
{
  auto const* master = find(config.master);
  if (!master) {
    return error_encoded(ERR_INVALID_SOURCE | FIELD_MASTER_SOURCE);
  }

  /* Identify the main clock that feeds the master, if any. */
  const source* main = nullptr;
  bool const pll = is_pll(config.master);
  if (pll) {
    if (is_main(config.reference)) {
      main = find(config.reference);
    }
    /* USB needs the accuracy of the crystal or an external clock. */
    if ((!main)
        || ((source_id::upll == config.master)
            && (source_id::main_rc == main->id))) {
      return error_encoded(ERR_INVALID_SOURCE | FIELD_REFERENCE);
    }
  } else if (is_main(config.master)) {
    main = master;
  }

  if (main) {
    bool ok;
    if (source_id::main_rc == main->id) {
      ok = valid_rc_Hz(config.main_Hz);
    } else {
      ok = (main->min_Hz <= config.main_Hz) && (config.main_Hz <= main->max_Hz);
    }
    if (!ok) {
      return error_encoded(ERR_OUT_OF_RANGE | FIELD_MAIN_FREQUENCY);
    }
  }

  if (prescaler_type::div3 < config.prescaler) {
    return error_encoded(ERR_OUT_OF_RANGE | FIELD_PRESCALER);
  }

  uint64_t source_Hz;
  if (source_id::slow == config.master) {
    source_Hz = config.slow_xtal ? SlowXtal_Hz : SlowRC_Hz;
  } else if (main == master) {
    source_Hz = config.main_Hz;
  } else if (source_id::plla == config.master) {
    if ((config.pll_mul < variant_.pll_mul_min)
        || (variant_.pll_mul_max < config.pll_mul)) {
      return error_encoded(ERR_OUT_OF_RANGE | FIELD_PLL_MUL);
    }
    if ((config.pll_div < variant_.pll_div_min)
        || (variant_.pll_div_max < config.pll_div)) {
      return error_encoded(ERR_OUT_OF_RANGE | FIELD_PLL_DIV);
    }
    /* Compare scaled values so fractional inputs are not truncated
     * into range. */
    uint64_t const main_Hz = config.main_Hz;
    if ((main_Hz < uint64_t{variant_.plla_in_min_Hz} * config.pll_div)
        || ((uint64_t{variant_.plla_in_max_Hz} * config.pll_div) < main_Hz)) {
      return error_encoded(ERR_OUT_OF_RANGE | FIELD_PLL_INPUT);
    }
    source_Hz = (main_Hz * config.pll_mul) / config.pll_div;
    if ((source_Hz < master->min_Hz)
        || (master->max_Hz < source_Hz)) {
      return error_encoded(ERR_OUT_OF_RANGE | FIELD_PLL_OUTPUT);
    }
  } else {
    /* UPLL: fixed multiplier, fixed reference. */
    if (variant_.upll_ref_Hz != config.main_Hz) {
      return error_encoded(ERR_OUT_OF_RANGE | FIELD_PLL_INPUT);
    }
    source_Hz = uint64_t{config.main_Hz} * variant_.upll_mul;
  }

  uint64_t master_Hz = source_Hz;
  if (pll && config.pll_div2) {
    master_Hz /= 2;
  }
  master_Hz /= divisor(config.prescaler);
  if (variant_.max_master_Hz < master_Hz) {
    return error_encoded(ERR_OUT_OF_RANGE | FIELD_MASTER_FREQUENCY);
  }

  /* Peripherals are clocked from MCK undivided. */
  uint64_t const peripheral_Hz = master_Hz;
  if (variant_.max_peripheral_Hz < peripheral_Hz) {
    return error_encoded(ERR_OUT_OF_RANGE | FIELD_PERIPHERAL_FREQUENCY);
  }

  validated = validated_config{config,
                               static_cast<unsigned int>(source_Hz),
                               static_cast<unsigned int>(master_Hz),
                               static_cast<unsigned int>(peripheral_Hz)};
  return 0;
}

sequencer::sequencer (hw::pmc_interface& pmc,
                      hw::supc_interface& supc,
                      hw::efc_interface& efc,
                      hw::time_source& time) :
  pmc_{pmc},
  supc_{supc},
  efc_{efc},
  time_{time},
  master_Hz_{active_.master_Hz()},
  peripheral_Hz_{active_.peripheral_Hz()},
  trace_{&trace_storage_[0], trace_storage_.max_size()}
{ }

const char*
sequencer::state_name (state_type st)
{
  switch (st) {
    case ST_unconfigured:
      return "unconfigured";
    case ST_oscillator_stabilizing:
      return "oscillator-stabilizing";
    case ST_pll_locking:
      return "pll-locking";
    case ST_switch_pending:
      return "switch-pending";
    case ST_stable:
      return "stable";
    case ST_failed:
      return "failed";
  }
  return "?";
}

void
sequencer::enter_ (state_type st)
{
  state_ = st;
  if (trace_.full()) {
    (void)trace_.pop();
  }
  trace_.push(st);
}

int
sequencer::fail_ (error_type ec)
{
  failure_ = error_encoded(ec);
  enter_(ST_failed);
  return failure_;
}

bool
sequencer::trace_pop (state_type& st)
{
  if (trace_.empty()) {
    return false;
  }
  st = static_cast<state_type>(trace_.pop());
  return true;
}

template <typename PRED>
bool
sequencer::poll_ (PRED pred,
                  duration_type timeout)
{
  auto const t0 = time_.now();
  while (!pred()) {
    if ((time_.now() - t0) >= timeout) {
      /* One last look so a flag that settled while time advanced is
       * not reported as a timeout. */
      return pred();
    }
  }
  return true;
}

bool
sequencer::wait_ (hw::flag f,
                  duration_type timeout)
{
  return poll_([this, f]() { return pmc_.ready(f); }, timeout);
}

int
sequencer::write_master_ (const hw::master_state& st,
                          duration_type timeout)
{
  pmc_.master(st);
  if (!wait_(hw::flag::master_ready, timeout)) {
    return fail_(ERR_SWITCH_TIMEOUT);
  }
  return 0;
}

int
sequencer::park_on_main_ (duration_type timeout)
{
  auto st = pmc_.master();
  if (!css_is_pll(st.css)) {
    return 0;
  }
  st.css = hw::master_select::main;
  return write_master_(st, timeout);
}

void
sequencer::raise_flash_ (unsigned int freq_Hz)
{
  auto const fws = flash_wait_states(freq_Hz);
  if (efc_.wait_states() < fws) {
    efc_.wait_states(fws);
  }
}

void
sequencer::lower_flash_ (unsigned int freq_Hz)
{
  auto const fws = flash_wait_states(freq_Hz);
  if (fws < efc_.wait_states()) {
    efc_.wait_states(fws);
  }
}

int
sequencer::stabilize_main_ (const validated_config& validated,
                            bool& reference_changed,
                            duration_type timeout)
{
  auto const& config = validated.config();
  auto const want = validated.main_source();
  bool const to_xtal = (source_id::main_rc != want);
  bool const bypass = (source_id::main_bypass == want);
  auto mor = pmc_.main_oscillator();

  bool const rc_change = (!to_xtal)
    && ((!mor.rc_enabled) || (config.main_Hz != mor.rc_Hz));
  bool const xtal_change = to_xtal
    && ((bypass != mor.bypass) || (bypass == mor.xtal_enabled));
  bool const select_change = (to_xtal != mor.xtal_selected);

  /* The oscillator currently feeding main is about to change.  A PLL
   * driving the master clock would lose its reference, so move the
   * master clock to main first. */
  bool const disturbs = select_change
    || (mor.xtal_selected ? xtal_change : rc_change);
  reference_changed = disturbs;
  if (disturbs) {
    auto rc = park_on_main_(timeout);
    if (0 > rc) {
      return rc;
    }
  }

  if (!to_xtal) {
    if (rc_change) {
      mor.rc_enabled = true;
      mor.rc_Hz = config.main_Hz;
      pmc_.main_oscillator(mor);
    }
    if (!wait_(hw::flag::main_rc_ready, timeout)) {
      return fail_(ERR_OSCILLATOR_TIMEOUT);
    }
  } else {
    if (xtal_change) {
      mor.xtal_enabled = !bypass;
      mor.bypass = bypass;
      mor.xtal_startup = XtalStartup;
      pmc_.main_oscillator(mor);
    }
    if ((!bypass)
        && (!wait_(hw::flag::main_xtal_ready, timeout))) {
      return fail_(ERR_OSCILLATOR_TIMEOUT);
    }
  }

  if (select_change) {
    mor.xtal_selected = to_xtal;
    pmc_.main_oscillator(mor);
  }
  if (!wait_(hw::flag::main_select_done, timeout)) {
    return fail_(ERR_OSCILLATOR_TIMEOUT);
  }
  return 0;
}

int
sequencer::lock_pll_ (const validated_config& validated,
                      bool restart,
                      duration_type timeout)
{
  auto const& config = validated.config();
  if (source_id::plla == config.master) {
    hw::pll_state const want{config.pll_mul, config.pll_div, PllaLockCount};
    auto const cur = pmc_.plla();
    /* A lock obtained against the previous reference means nothing. */
    bool const stale = restart && (0 != cur.mul);
    if (stale
        || (want != cur)
        || (!pmc_.ready(hw::flag::plla_locked))) {
      if (hw::master_select::plla == pmc_.master().css) {
        auto rc = park_on_main_(timeout);
        if (0 > rc) {
          return rc;
        }
      }
      if (stale) {
        pmc_.plla(hw::pll_state{});
      }
      pmc_.plla(want);
    }
  } else {
    bool const running = pmc_.upll_enabled();
    if (running && restart) {
      if (hw::master_select::upll == pmc_.master().css) {
        auto rc = park_on_main_(timeout);
        if (0 > rc) {
          return rc;
        }
      }
      pmc_.upll_disable();
    }
    if ((!running) || restart) {
      pmc_.upll_enable(UpllLockCount);
    }
  }
  if (!wait_(ready_flag(config.master), timeout)) {
    return fail_(ERR_PLL_TIMEOUT);
  }
  return 0;
}

int
sequencer::switch_master_ (const validated_config& validated,
                           duration_type timeout)
{
  auto const& config = validated.config();
  bool const pll = is_pll(config.master);
  hw::master_state want;
  want.css = css_for(config.master);
  want.pres = static_cast<uint8_t>(config.prescaler);
  want.plladiv2 = (source_id::plla == config.master) && config.pll_div2;
  want.uplldiv2 = (source_id::upll == config.master) && config.pll_div2;

  auto const cur = pmc_.master();
  bool const divider_change = (cur.pres != want.pres)
    || (cur.plladiv2 != want.plladiv2)
    || (cur.uplldiv2 != want.uplldiv2);
  int rc = 0;

  if (pll) {
    /* Prescaler first, so the PLL output is never applied undivided.
     * Moving between PLLs passes through main. */
    auto step = want;
    step.css = cur.css;
    if (css_is_pll(cur.css) && (cur.css != want.css)) {
      step.css = hw::master_select::main;
    }
    if (divider_change || (step.css != cur.css)) {
      rc = write_master_(step, timeout);
    }
    if ((0 == rc) && (step.css != want.css)) {
      rc = write_master_(want, timeout);
    }
  } else {
    /* Source first, then the prescaler. */
    if (cur.css != want.css) {
      auto step = cur;
      step.css = want.css;
      rc = write_master_(step, timeout);
    }
    if ((0 == rc) && divider_change) {
      rc = write_master_(want, timeout);
    }
  }
  if (0 > rc) {
    return rc;
  }

  /* Confirm the selector reads back as requested. */
  if (!poll_([this, &want]() { return pmc_.master().css == want.css; }, timeout)) {
    return fail_(ERR_SWITCH_TIMEOUT);
  }
  return 0;
}

void
sequencer::release_unused_main_ (const validated_config& validated)
{
  auto const want = validated.main_source();
  if (source_id::slow == want) {
    return;
  }
  auto mor = pmc_.main_oscillator();
  if (source_id::main_rc == want) {
    if (mor.xtal_enabled || mor.bypass) {
      mor.xtal_enabled = false;
      mor.bypass = false;
      pmc_.main_oscillator(mor);
    }
  } else if (mor.rc_enabled) {
    mor.rc_enabled = false;
    pmc_.main_oscillator(mor);
  }
}

int
sequencer::apply (const validated_config& validated,
                  duration_type timeout)
{
  auto const& config = validated.config();

  trace_.clear();
  failure_ = 0;
  enter_(ST_unconfigured);

  enter_(ST_oscillator_stabilizing);
  if (config.slow_xtal && (!supc_.slow_xtal_selected())) {
    supc_.slow_xtal_select();
    if (!poll_([this]() { return supc_.slow_xtal_selected(); }, timeout)) {
      return fail_(ERR_OSCILLATOR_TIMEOUT);
    }
  }

  /* Parking and the main-routed prescaler step may run the master
   * clock from main undivided. */
  bool const uses_main = (source_id::slow != validated.main_source());
  unsigned int peak_Hz = validated.master_Hz();
  if (uses_main && (peak_Hz < config.main_Hz)) {
    peak_Hz = config.main_Hz;
  }
  raise_flash_(peak_Hz);

  bool reference_changed = false;
  if (uses_main) {
    auto rc = stabilize_main_(validated, reference_changed, timeout);
    if (0 > rc) {
      return rc;
    }
  }

  if (is_pll(config.master)) {
    enter_(ST_pll_locking);
    auto rc = lock_pll_(validated, reference_changed, timeout);
    if (0 > rc) {
      return rc;
    }
  }

  enter_(ST_switch_pending);
  auto rc = switch_master_(validated, timeout);
  if (0 > rc) {
    return rc;
  }
  lower_flash_(validated.master_Hz());

  release_unused_main_(validated);

  active_ = validated;
  master_Hz_ = validated.master_Hz();
  peripheral_Hz_ = validated.peripheral_Hz();
  if (source_id::slow == config.master) {
    /* The slow clock may already have been on the crystal. */
    unsigned int const slow_Hz = supc_.slow_xtal_selected() ? model::SlowXtal_Hz : model::SlowRC_Hz;
    master_Hz_ = slow_Hz / divisor(config.prescaler);
    peripheral_Hz_ = master_Hz_;
  }
  enter_(ST_stable);
  return 0;
}

source_id
sequencer::active_source () const
{
  switch (pmc_.master().css) {
    case hw::master_select::slow:
      return source_id::slow;
    case hw::master_select::plla:
      return source_id::plla;
    case hw::master_select::upll:
      return source_id::upll;
    case hw::master_select::main:
      break;
  }
  auto const mor = pmc_.main_oscillator();
  if (!mor.xtal_selected) {
    return source_id::main_rc;
  }
  return mor.bypass ? source_id::main_bypass : source_id::main_xtal;
}

int
sequencer::measure_main_Hz (duration_type timeout)
{
  if (!wait_(hw::flag::main_frequency_ready, timeout)) {
    return error_encoded(ERR_OSCILLATOR_TIMEOUT);
  }
  uint64_t const slow_Hz = supc_.slow_xtal_selected() ? model::SlowXtal_Hz : model::SlowRC_Hz;
  return static_cast<int>((pmc_.main_frequency_count() * slow_Hz) / 16);
}

} // namespace clock
} // namespace samcxx
