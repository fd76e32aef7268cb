#pragma once

#include "gen_server.hpp"
#include "genserver_exception.hpp"
#include "lifecycle.hpp"
#include "message.hpp"
#include "message_handlers.hpp"
#include "scoped_gen_server.hpp"
#include "traits.hpp"
#include "typed_gen_server.hpp"

#include "glog/logging.h"
