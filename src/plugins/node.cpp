#include "../plugin.hpp"

// Host-side services backed by local tooling
static troupe::PluginRegistrar reg_node(troupe::Plugin{
    "node",
    "Core host services for the agent",
    {"DESCRIBE_IMAGE"},
    {},
    {},
    {"browser", "image_description", "pdf", "speech", "transcription", "video"},
    {}
});
