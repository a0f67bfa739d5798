// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

/* Register surface for SAM3X/SAM3A parts, implemented over the CMSIS
 * device structures.  This is the only translation unit that touches
 * peripheral addresses. */

#include <sam.h>

#include <samcxx/hw.hpp>

namespace samcxx {
namespace hw {

namespace {

/* Write key required on every CKGR_MOR store. */
constexpr uint32_t MOR_KEY = CKGR_MOR_KEY(0x37u);

/* Write key required on every SUPC_CR store. */
constexpr uint32_t SUPC_KEY = SUPC_CR_KEY(0xA5u);

uint32_t
pmc_sr_bit (flag f)
{
  switch (f) {
    case flag::main_rc_ready:
      return PMC_SR_MOSCRCS;
    case flag::main_xtal_ready:
      return PMC_SR_MOSCXTS;
    case flag::main_select_done:
      return PMC_SR_MOSCSELS;
    case flag::plla_locked:
      return PMC_SR_LOCKA;
    case flag::upll_locked:
      return PMC_SR_LOCKU;
    case flag::master_ready:
      return PMC_SR_MCKRDY;
    default:
      break;
  }
  return 0;
}

uint32_t
rc_field (unsigned int freq_Hz)
{
  if (12'000'000 == freq_Hz) {
    return CKGR_MOR_MOSCRCF_12_MHz;
  }
  if (8'000'000 == freq_Hz) {
    return CKGR_MOR_MOSCRCF_8_MHz;
  }
  return CKGR_MOR_MOSCRCF_4_MHz;
}

unsigned int
rc_frequency (uint32_t mor)
{
  switch (mor & CKGR_MOR_MOSCRCF_Msk) {
    case CKGR_MOR_MOSCRCF_12_MHz:
      return 12'000'000;
    case CKGR_MOR_MOSCRCF_8_MHz:
      return 8'000'000;
    default:
      break;
  }
  return 4'000'000;
}

class sam3x_pmc : public pmc_interface
{
public:
  bool ready (flag f) const override
  {
    switch (f) {
      case flag::none:
        return true;
      case flag::slow_xtal_selected:
        return SUPC->SUPC_SR & SUPC_SR_OSCSEL;
      case flag::main_frequency_ready:
        return PMC->CKGR_MCFR & CKGR_MCFR_MAINFRDY;
      default:
        break;
    }
    return PMC->PMC_SR & pmc_sr_bit(f);
  }

  main_oscillator_state main_oscillator () const override
  {
    uint32_t const mor = PMC->CKGR_MOR;
    main_oscillator_state st;
    st.rc_enabled = mor & CKGR_MOR_MOSCRCEN;
    st.rc_Hz = rc_frequency(mor);
    st.xtal_enabled = mor & CKGR_MOR_MOSCXTEN;
    st.bypass = mor & CKGR_MOR_MOSCXTBY;
    st.xtal_selected = mor & CKGR_MOR_MOSCSEL;
    st.xtal_startup = (mor & CKGR_MOR_MOSCXTST_Msk) >> CKGR_MOR_MOSCXTST_Pos;
    return st;
  }

  void main_oscillator (const main_oscillator_state& st) override
  {
    uint32_t mor = MOR_KEY | rc_field(st.rc_Hz) | CKGR_MOR_MOSCXTST(st.xtal_startup);
    if (st.rc_enabled) {
      mor |= CKGR_MOR_MOSCRCEN;
    }
    if (st.xtal_enabled) {
      mor |= CKGR_MOR_MOSCXTEN;
    }
    if (st.bypass) {
      mor |= CKGR_MOR_MOSCXTBY;
    }
    if (st.xtal_selected) {
      mor |= CKGR_MOR_MOSCSEL;
    }
    PMC->CKGR_MOR = mor;
  }

  pll_state plla () const override
  {
    uint32_t const pllar = PMC->CKGR_PLLAR;
    pll_state st;
    unsigned int const mula = (pllar & CKGR_PLLAR_MULA_Msk) >> CKGR_PLLAR_MULA_Pos;
    st.mul = mula ? (1 + mula) : 0;
    st.div = (pllar & CKGR_PLLAR_DIVA_Msk) >> CKGR_PLLAR_DIVA_Pos;
    st.count = (pllar & CKGR_PLLAR_PLLACOUNT_Msk) >> CKGR_PLLAR_PLLACOUNT_Pos;
    return st;
  }

  void plla (const pll_state& st) override
  {
    uint32_t pllar = CKGR_PLLAR_ONE;
    if (st.mul) {
      pllar |= (CKGR_PLLAR_MULA(st.mul - 1U)
                | CKGR_PLLAR_DIVA(st.div)
                | CKGR_PLLAR_PLLACOUNT(st.count));
    }
    PMC->CKGR_PLLAR = pllar;
  }

  bool upll_enabled () const override
  {
    return PMC->CKGR_UCKR & CKGR_UCKR_UPLLEN;
  }

  void upll_enable (uint8_t count) override
  {
    PMC->CKGR_UCKR = CKGR_UCKR_UPLLEN | CKGR_UCKR_UPLLCOUNT(count);
  }

  void upll_disable () override
  {
    PMC->CKGR_UCKR = 0;
  }

  master_state master () const override
  {
    uint32_t const mckr = PMC->PMC_MCKR;
    master_state st;
    st.css = static_cast<master_select>(mckr & PMC_MCKR_CSS_Msk);
    st.pres = (mckr & PMC_MCKR_PRES_Msk) >> PMC_MCKR_PRES_Pos;
    st.plladiv2 = mckr & PMC_MCKR_PLLADIV2;
    st.uplldiv2 = mckr & PMC_MCKR_UPLLDIV2;
    return st;
  }

  void master (const master_state& st) override
  {
    uint32_t mckr = (static_cast<uint32_t>(st.css) << PMC_MCKR_CSS_Pos)
      | ((static_cast<uint32_t>(st.pres) << PMC_MCKR_PRES_Pos) & PMC_MCKR_PRES_Msk);
    if (st.plladiv2) {
      mckr |= PMC_MCKR_PLLADIV2;
    }
    if (st.uplldiv2) {
      mckr |= PMC_MCKR_UPLLDIV2;
    }
    PMC->PMC_MCKR = mckr;
  }

  unsigned int main_frequency_count () const override
  {
    return (PMC->CKGR_MCFR & CKGR_MCFR_MAINF_Msk) >> CKGR_MCFR_MAINF_Pos;
  }

  bool peripheral_enabled (periph::id pid) const override
  {
    auto const n = static_cast<unsigned int>(pid);
    if (32 > n) {
      return PMC->PMC_PCSR0 & (1U << n);
    }
    return PMC->PMC_PCSR1 & (1U << (n - 32));
  }

  void peripheral_enable (periph::id pid) override
  {
    auto const n = static_cast<unsigned int>(pid);
    if (32 > n) {
      PMC->PMC_PCER0 = (1U << n);
    } else {
      PMC->PMC_PCER1 = (1U << (n - 32));
    }
  }

  void peripheral_disable (periph::id pid) override
  {
    auto const n = static_cast<unsigned int>(pid);
    if (32 > n) {
      PMC->PMC_PCDR0 = (1U << n);
    } else {
      PMC->PMC_PCDR1 = (1U << (n - 32));
    }
  }
};

class sam3x_supc : public supc_interface
{
public:
  bool slow_xtal_selected () const override
  {
    return SUPC->SUPC_SR & SUPC_SR_OSCSEL;
  }

  void slow_xtal_select () override
  {
    SUPC->SUPC_CR = SUPC_KEY | SUPC_CR_XTALSEL;
  }
};

class sam3x_efc : public efc_interface
{
public:
  uint8_t wait_states () const override
  {
    return (EFC0->EEFC_FMR & EEFC_FMR_FWS_Msk) >> EEFC_FMR_FWS_Pos;
  }

  void wait_states (uint8_t fws) override
  {
    write_fws_(EFC0, fws);
#ifdef EFC1
    write_fws_(EFC1, fws);
#endif /* EFC1 */
  }

private:
  static void write_fws_ (Efc* efc,
                          uint8_t fws)
  {
    efc->EEFC_FMR = (efc->EEFC_FMR & ~EEFC_FMR_FWS_Msk) | EEFC_FMR_FWS(fws);
  }
};

Pio*
pio_for (unsigned int group)
{
  switch (group) {
    case 0:
      return PIOA;
    case 1:
      return PIOB;
#ifdef PIOC
    case 2:
      return PIOC;
#endif /* PIOC */
#ifdef PIOD
    case 3:
      return PIOD;
#endif /* PIOD */
#ifdef PIOE
    case 4:
      return PIOE;
#endif /* PIOE */
#ifdef PIOF
    case 5:
      return PIOF;
#endif /* PIOF */
    default:
      break;
  }
  return nullptr;
}

/* The registry only passes groups that exist on the variant, so a
 * null controller is never dereferenced. */
class sam3x_pio : public pio_interface
{
public:
  void select_peripheral (unsigned int group,
                          uint32_t mask,
                          bool b) override
  {
    auto pio = pio_for(group);
    if (b) {
      pio->PIO_ABSR |= mask;
    } else {
      pio->PIO_ABSR &= ~mask;
    }
  }

  void pio_enable (unsigned int group,
                   uint32_t mask) override
  {
    pio_for(group)->PIO_PER = mask;
  }

  void pio_disable (unsigned int group,
                    uint32_t mask) override
  {
    pio_for(group)->PIO_PDR = mask;
  }

  void output_enable (unsigned int group,
                      uint32_t mask,
                      bool enable) override
  {
    auto pio = pio_for(group);
    if (enable) {
      pio->PIO_OER = mask;
    } else {
      pio->PIO_ODR = mask;
    }
  }

  void pullup_enable (unsigned int group,
                      uint32_t mask,
                      bool enable) override
  {
    auto pio = pio_for(group);
    if (enable) {
      pio->PIO_PUER = mask;
    } else {
      pio->PIO_PUDR = mask;
    }
  }

  void multidrive_enable (unsigned int group,
                          uint32_t mask,
                          bool enable) override
  {
    auto pio = pio_for(group);
    if (enable) {
      pio->PIO_MDER = mask;
    } else {
      pio->PIO_MDDR = mask;
    }
  }

  void output_set (unsigned int group,
                   uint32_t mask,
                   bool high) override
  {
    auto pio = pio_for(group);
    if (high) {
      pio->PIO_SODR = mask;
    } else {
      pio->PIO_CODR = mask;
    }
  }

  uint32_t output_data (unsigned int group) const override
  {
    return pio_for(group)->PIO_ODSR;
  }

  uint32_t pin_data (unsigned int group) const override
  {
    return pio_for(group)->PIO_PDSR;
  }
};

sam3x_pmc pmc_instance;
sam3x_supc supc_instance;
sam3x_efc efc_instance;
sam3x_pio pio_instance;

} // ns anonymous

pmc_interface&
pmc ()
{
  return pmc_instance;
}

supc_interface&
supc ()
{
  return supc_instance;
}

efc_interface&
efc ()
{
  return efc_instance;
}

pio_interface&
pio ()
{
  return pio_instance;
}

} // namespace hw
} // namespace samcxx
