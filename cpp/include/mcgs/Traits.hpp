#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/BackpropSelectors.hpp"
#include "mcgs/RandomSimulator.hpp"
#include "mcgs/UcbRolloutSelector.hpp"
#include "mcgs/concepts/BackpropSelectorConcept.hpp"
#include "mcgs/concepts/RolloutSelectorConcept.hpp"
#include "mcgs/concepts/SimulatorConcept.hpp"

namespace mcgs {

template <core::concepts::Game G,
          mcgs::concepts::RolloutSelector<G> RS = mcgs::UcbRolloutSelector<G>,
          mcgs::concepts::BackpropSelector<G> BS = mcgs::BestParentBackpropSelector<G>,
          mcgs::concepts::Simulator<G> Sim = mcgs::RandomSimulator<G>>
struct Traits {
  using Game = G;
  using RolloutSelector = RS;
  using BackpropSelector = BS;
  using Simulator = Sim;
};

}  // namespace mcgs
