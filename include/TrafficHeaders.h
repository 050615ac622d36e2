#pragma once

// Response headers shared by the stress server and the traffic agent.
namespace headers
{
  constexpr const char* kServerId = "X-Server-ID";
  constexpr const char* kRequestId = "X-Request-ID";
  constexpr const char* kEndpoint = "X-Endpoint";
  constexpr const char* kResponseTimeMs = "X-Response-Time-Ms";
  constexpr const char* kMediaSizeMb = "X-Media-Size-MB";
}

// Value the agent records when a response carries no server marker.
constexpr const char* kUnknownServer = "unknown";

constexpr int kDefaultServerPort = 7777;
