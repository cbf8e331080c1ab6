#include <cmath>
#include <iostream>
#include <string>

#include "storyloom/core/complex_events.h"

#define SL_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_complex_events() {
  using namespace storyloom;

  {
    const ComplexEvent war = WarDeclarationEvent{{"a"}, {"b"}, "border", {}, -1.0};
    const ComplexEvent trade = TradeEvent{"grain", 10.0, 0.0};
    const ComplexEvent pol = PoliticalEvent{"a", "coup", -5.0};
    const ComplexEvent dip = DiplomaticEvent{"b", "a", 4.0};
    const ComplexEvent enc = EncounterEvent{"bandits", "ford", {}, 0.0};

    SL_ASSERT(event_priority(war) > event_priority(pol));
    SL_ASSERT(event_priority(pol) > event_priority(dip));
    SL_ASSERT(event_priority(dip) > event_priority(trade));
    SL_ASSERT(event_priority(trade) > event_priority(enc));

    SL_ASSERT(event_cooldown_key(war) == "war:a>b");
    SL_ASSERT(event_cooldown_key(trade) == "trade:grain");
    SL_ASSERT(event_cooldown_key(pol) == "political:a");
    // Order of the two factions does not matter.
    SL_ASSERT(event_cooldown_key(dip) == "diplomatic:a|b");
    SL_ASSERT(event_cooldown_key(enc) == "encounter:bandits");
    SL_ASSERT(std::string(event_kind_label(enc)) == "encounter");

    const ComplexEvent battle = BattleEvent{};
    SL_ASSERT(event_cooldown_key(battle).empty());
  }

  // Consciousness scaling applies to negative impacts only.
  {
    SL_ASSERT(scale_impact(3.0, 15.0) == 3.0);
    SL_ASSERT(scale_impact(-1.0, 7.0) == -1.0);
    SL_ASSERT(std::fabs(scale_impact(-1.0, 12.0) - -0.8) < 1e-9);
    SL_ASSERT(scale_impact(-1.0, 25.0) == 0.0);
    SL_ASSERT(std::fabs(scale_impact(-1.0, 3.0) - -1.2) < 1e-9);
  }

  return 0;
}
