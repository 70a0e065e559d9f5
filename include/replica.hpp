#pragma once

/** \file replica.hpp
 *  \brief Umbrella header for the replica state library
 */

#include "replica/collection_state.hpp"
#include "replica/collection_store.hpp"
#include "replica/config.hpp"
#include "replica/entity_store.hpp"
#include "replica/error.hpp"
#include "replica/log.hpp"
#include "replica/merge.hpp"
#include "replica/messages.hpp"
#include "replica/signal.hpp"
#include "replica/status_code.hpp"
#include "replica/transfer_state.hpp"
#include "replica/transport.hpp"
