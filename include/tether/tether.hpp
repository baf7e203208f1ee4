#pragma once

#include "channel.hpp"
#include "client.hpp"
#include "config.hpp"
#include "correlator.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "execution.hpp"
#include "format.hpp"
#include "health.hpp"
#include "protocol.hpp"
#include "timer.hpp"
#include "transport.hpp"
#include "utils.hpp"
