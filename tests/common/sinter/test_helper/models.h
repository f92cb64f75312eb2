#pragma once
#include "sinter/dynamics/dynamics.h"
#include "sinter/dynamics/dynamics_properties.h"
#include "sinter/dynamics/value.h"
#include "sinter/network/connectivity.h"
#include "sinter/network/projection.h"
#include <string>

namespace sinter::test_helper {

/**
 * Integrate-and-fire cell.
 * Ports: v (analog send), spike (event send), isyn (analog reduce), feedback (event receive).
 */
dynamics::Dynamics iaf_dynamics();

dynamics::DynamicsProperties iaf_properties();

/**
 * Exponentially decaying synapse incremented by weight on every spike.
 * Ports: spike (event receive), i (analog send), feedback (event send, emitted on spike).
 */
dynamics::Dynamics exponential_synapse_dynamics();

dynamics::DynamicsProperties exponential_synapse_properties(dynamics::Value const& weight);

/**
 * Synapse with quadratic decay, which is not linear in its state.
 * Ports equal the ones of the exponential synapse.
 */
dynamics::Dynamics quadratic_synapse_dynamics();

dynamics::DynamicsProperties quadratic_synapse_properties(dynamics::Value const& weight);

/**
 * Linear synapse driven continuously by its weight.
 * Ports equal the ones of the exponential synapse.
 */
dynamics::Dynamics driven_synapse_dynamics();

dynamics::DynamicsProperties driven_synapse_properties(dynamics::Value const& weight);

/**
 * Projection with given response dynamics connecting pre spikes to the response and the
 * response current to the post cell's synaptic input.
 * @param with_feedback Additionally connect the response's feedback events to the pre cell
 */
network::Projection make_projection(
    std::string const& name,
    std::string const& pre,
    std::string const& post,
    dynamics::DynamicsProperties const& response,
    network::ConnectivityRule const& connectivity = network::AllToAll(),
    bool with_feedback = false);

} // namespace sinter::test_helper
