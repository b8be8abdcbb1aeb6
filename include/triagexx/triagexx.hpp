/*

triagexx.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <triagexx/config.hpp>
#include <triagexx/detail/log.hpp>
#include <triagexx/detail/result.hpp>
#include <triagexx/triage_config.hpp>
#include <triagexx/timestamp.hpp>
#include <triagexx/mime/raw_message.hpp>
#include <triagexx/mime/raw_message_json.hpp>
#include <triagexx/mime/decoder.hpp>
#include <triagexx/signals/extractor.hpp>
#include <triagexx/triage/taxonomy.hpp>
#include <triagexx/triage/output.hpp>
#include <triagexx/triage/deadline.hpp>
#include <triagexx/triage/normalizer.hpp>
#include <triagexx/gateway/gateway.hpp>
#include <triagexx/gateway/replay_gateway.hpp>
#include <triagexx/pipeline/stats.hpp>
#include <triagexx/pipeline/orchestrator.hpp>
