#ifndef PIPEFLOW_HPP
#define PIPEFLOW_HPP

#include "config.hpp"
#include "log.hpp"
#include "message.hpp"
#include "task.hpp"
#include "node.hpp"
#include "pipeline.hpp"
#include "tools.hpp"

#endif
