#pragma once

// blendpipe - remote script execution and pipeline orchestration
// Include this header to get the full client API

#include <blendpipe/errors.h>
#include <blendpipe/config.h>
#include <blendpipe/protocol.h>
#include <blendpipe/network/tcp_channel.h>
#include <blendpipe/execution_client.h>
#include <blendpipe/retry_policy.h>
#include <blendpipe/pipeline.h>
#include <blendpipe/pipeline_config.h>
#include <blendpipe/status_bridge.h>
