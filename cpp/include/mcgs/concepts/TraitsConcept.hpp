#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/concepts/BackpropSelectorConcept.hpp"
#include "mcgs/concepts/RolloutSelectorConcept.hpp"
#include "mcgs/concepts/SimulatorConcept.hpp"

namespace mcgs {
namespace concepts {

template <class T>
concept Traits = requires {
  typename T::Game;
  typename T::RolloutSelector;
  typename T::BackpropSelector;
  typename T::Simulator;

  requires core::concepts::Game<typename T::Game>;
  requires mcgs::concepts::RolloutSelector<typename T::RolloutSelector, typename T::Game>;
  requires mcgs::concepts::BackpropSelector<typename T::BackpropSelector, typename T::Game>;
  requires mcgs::concepts::Simulator<typename T::Simulator, typename T::Game>;
};

}  // namespace concepts
}  // namespace mcgs
