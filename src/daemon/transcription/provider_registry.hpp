#pragma once

#include "../config.hpp"
#include "provider_catalog.hpp"
#include "provider_client.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

enum class ProviderRole { Primary, Fallback };

std::string_view to_string(ProviderRole role);

struct ProviderSlot {
    ProviderRole role = ProviderRole::Primary;
    ProviderKind kind = ProviderKind::Groq;
    std::shared_ptr<ProviderClient> client;
    ProviderSettings settings;
};

// What one session will use. Unconfigured providers are absent; when only the
// fallback is configured it is promoted into primary.
struct ProviderSelection {
    std::optional<ProviderSlot> primary;
    std::optional<ProviderSlot> fallback;
    std::chrono::milliseconds timeout{20000};
};

// Maps provider kinds to client instances and resolves the configured
// primary/fallback pair. snapshot() re-reads the settings source every time so
// configuration changes apply to the next session.
class ProviderRegistry {
public:
    using SettingsSource = std::function<Config::Providers()>;
    using EnvLookup = std::function<std::string(const std::string&)>;

    explicit ProviderRegistry(SettingsSource source, EnvLookup env = {});

    void add(std::shared_ptr<ProviderClient> client);

    ProviderSelection snapshot() const;

    ProviderSettings resolve(ProviderKind kind, const Config::Providers& cfg) const;
    static bool is_configured(ProviderKind kind, const ProviderSettings& settings);

private:
    std::optional<ProviderSlot> make_slot(ProviderKind kind, ProviderRole role,
                                          const Config::Providers& cfg) const;

    SettingsSource source_;
    EnvLookup env_;
    std::map<ProviderKind, std::shared_ptr<ProviderClient>> clients_;
};

// Registry holding one client per supported provider.
std::unique_ptr<ProviderRegistry> make_default_registry(ProviderRegistry::SettingsSource source);
