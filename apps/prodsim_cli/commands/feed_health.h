#pragma once

// cmd_feed_health: PING the Redis server behind the quality feed.
// Usage: prodsim feed-health --redis <uri>
int cmd_feed_health(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
