#include "provider_registry.hpp"

#include "deepgram_client.hpp"
#include "elevenlabs_client.hpp"
#include "groq_client.hpp"
#include "lan_client.hpp"
#include "sarvam_client.hpp"

#include <cmath>
#include <cstdlib>
#include <print>

std::string_view to_string(ProviderRole role) {
    return role == ProviderRole::Primary ? "primary" : "fallback";
}

ProviderRegistry::ProviderRegistry(SettingsSource source, EnvLookup env)
    : source_(std::move(source)), env_(std::move(env)) {
    if (!env_) {
        env_ = [](const std::string& name) -> std::string {
            const char* v = std::getenv(name.c_str());
            return v ? v : "";
        };
    }
}

void ProviderRegistry::add(std::shared_ptr<ProviderClient> client) {
    auto kind = client->kind();
    clients_[kind] = std::move(client);
}

ProviderSettings ProviderRegistry::resolve(ProviderKind kind, const Config::Providers& cfg) const {
    const auto& entry = cfg.entry(std::string(catalog::name(kind)));

    ProviderSettings s;
    s.api_key = entry.api_key;
    if (s.api_key.empty()) {
        std::string var = !entry.api_key_env.empty()
                              ? entry.api_key_env
                              : std::string(catalog::credential_env_var(kind));
        if (!var.empty()) s.api_key = env_(var);
    }
    s.model = catalog::resolve_model(kind, entry.model);
    s.language = catalog::resolve_language(kind, s.model, entry.language);
    s.url = entry.url;
    s.api_format = entry.api_format;
    // Transport-level backstop; the orchestrator enforces the real deadline.
    s.timeout_s = static_cast<long>(std::ceil(cfg.timeout_seconds)) + 5;
    return s;
}

bool ProviderRegistry::is_configured(ProviderKind kind, const ProviderSettings& settings) {
    if (catalog::requires_credential(kind)) return !settings.api_key.empty();
    return !settings.url.empty();
}

std::optional<ProviderSlot> ProviderRegistry::make_slot(ProviderKind kind, ProviderRole role,
                                                        const Config::Providers& cfg) const {
    auto it = clients_.find(kind);
    if (it == clients_.end()) return std::nullopt;

    auto settings = resolve(kind, cfg);
    if (!is_configured(kind, settings)) return std::nullopt;

    return ProviderSlot{
        .role = role,
        .kind = kind,
        .client = it->second,
        .settings = std::move(settings),
    };
}

ProviderSelection ProviderRegistry::snapshot() const {
    auto cfg = source_();

    ProviderSelection sel;
    sel.timeout = std::chrono::milliseconds(
        static_cast<long long>(std::llround(cfg.timeout_seconds * 1000.0)));

    auto primary_kind = catalog::parse(cfg.primary);
    if (!primary_kind && !cfg.primary.empty()) {
        std::println(stderr, "registry: unknown primary provider '{}'", cfg.primary);
    }

    std::optional<ProviderKind> fallback_kind;
    if (!cfg.fallback.empty()) {
        fallback_kind = catalog::parse(cfg.fallback);
        if (!fallback_kind) {
            std::println(stderr, "registry: unknown fallback provider '{}'", cfg.fallback);
        }
    }
    if (fallback_kind && primary_kind && *fallback_kind == *primary_kind) {
        fallback_kind.reset();
    }

    if (primary_kind) sel.primary = make_slot(*primary_kind, ProviderRole::Primary, cfg);
    if (fallback_kind) sel.fallback = make_slot(*fallback_kind, ProviderRole::Fallback, cfg);

    if (!sel.primary && sel.fallback) {
        sel.fallback->role = ProviderRole::Primary;
        sel.primary = std::move(sel.fallback);
        sel.fallback.reset();
    }

    return sel;
}

std::unique_ptr<ProviderRegistry> make_default_registry(ProviderRegistry::SettingsSource source) {
    auto registry = std::make_unique<ProviderRegistry>(std::move(source));
    registry->add(std::make_shared<LanClient>());
    registry->add(std::make_shared<GroqClient>());
    registry->add(std::make_shared<DeepgramClient>());
    registry->add(std::make_shared<ElevenLabsClient>());
    registry->add(std::make_shared<SarvamClient>());
    return registry;
}
