#pragma once

/**
 * @file tether.hpp
 * @brief Umbrella header for the tether engine session library
 *
 * Include this header to get access to all tether public APIs.
 */

// Core
#include <tether/core/Error.hpp>
#include <tether/core/ErrorLogging.hpp>
#include <tether/core/Tcl.hpp>

// Session
#include <tether/session/Channel.hpp>
#include <tether/session/FifoMutex.hpp>
#include <tether/session/PtyChannel.hpp>
#include <tether/session/Session.hpp>
#include <tether/session/SessionConfig.hpp>
#include <tether/session/Transaction.hpp>
#include <tether/session/TransactionFramer.hpp>

// Reports
#include <tether/report/Envelope.hpp>
#include <tether/report/FieldExtractor.hpp>
#include <tether/report/ParsedReport.hpp>
#include <tether/report/ReportArchive.hpp>
#include <tether/report/ReportJson.hpp>
#include <tether/report/ReportParser.hpp>

// Simulation
#include <tether/sim/SimulationController.hpp>

// Tools
#include <tether/tools/AsyncExecutor.hpp>
#include <tether/tools/ToolDispatcher.hpp>

// I/O
#include <tether/io/ConfigLoader.hpp>
#include <tether/io/Console.hpp>
#include <tether/io/LogService.hpp>
#include <tether/io/LogSink.hpp>
