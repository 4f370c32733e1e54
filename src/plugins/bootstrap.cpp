#include "../plugin.hpp"

// Conversation basics every agent gets
static troupe::PluginRegistrar reg_bootstrap(troupe::Plugin{
    "bootstrap",
    "Agent bootstrap with basic actions and evaluators",
    {"CONTINUE", "FOLLOW_ROOM", "UNFOLLOW_ROOM", "IGNORE", "NONE",
     "MUTE_ROOM", "UNMUTE_ROOM"},
    {"time", "facts", "boredom"},
    {"FACT_EVALUATOR", "GOAL_EVALUATOR"},
    {},
    {}
});
