#include "scheduling.hpp"
#include "errors.hpp"
#include "time_resolver.hpp"
#include "utils.hpp"
#include <iostream>

namespace wakeprompt {

ScheduleEntry build_entry(const ScheduleDraft& draft, const ScheduleEntry* existing,
                          const Account& account, const std::string& binary_path,
                          const Config& cfg, TimePoint now) {
    ScheduleEntry e;
    e.id = existing ? existing->id : "";
    if (e.id.empty()) e.id = new_id();
    e.created_at = (existing && !is_unset(existing->created_at)) ? existing->created_at : now;
    e.updated_at = now;

    e.target = draft.target;
    e.target.prompt = trim(draft.target.prompt);
    e.target.model = trim(draft.target.model);
    e.target.permission_mode = trim(draft.target.permission_mode);
    if (e.target.model.empty()) e.target.model = cfg.default_model;
    if (e.target.permission_mode.empty()) e.target.permission_mode = cfg.default_permission_mode;
    if (e.target.prompt.empty()) throw ValidationError("prompt is required");

    e.schedule = normalize_spec(draft.schedule);
    validate_spec(e.schedule);

    e.timezone = trim(draft.timezone);
    if (e.timezone.empty() && existing) e.timezone = existing->timezone;
    if (!e.timezone.empty() && e.timezone != "Local" && !timezone_exists(e.timezone)) {
        throw ValidationError("unknown time zone: " + e.timezone);
    }

    e.binary_path = binary_path;
    e.account = account;
    if (existing) {
        if (e.account.user.empty()) e.account.user = existing->account.user;
        if (e.account.home_dir.empty()) e.account.home_dir = existing->account.home_dir;
        if (e.account.path_env.empty()) e.account.path_env = existing->account.path_env;
    }
    if (e.account.path_env.empty()) e.account.path_env = cfg.fallback_path;

    e.next_run = next_run(e, now);
    e.wake_time = format_wake_time(e.next_run);
    return e;
}

// ── ScheduleService ─────────────────────────────────────────────────

ScheduleService::ScheduleService(ScheduleStore& store, JobRegistrar& registrar, WakeScheduler& wake)
    : store_(store), registrar_(registrar), wake_(wake) {}

void ScheduleService::create(const ScheduleEntry& entry) {
    store_.add(entry);

    try {
        registrar_.install(entry);
    } catch (const RegistrationError&) {
        store_.remove(entry.id);
        throw;
    }

    try {
        wake_.schedule(entry, entry.wake_time);
    } catch (const RegistrationError&) {
        store_.remove(entry.id);
        registrar_.remove(entry);
        throw;
    }
}

void ScheduleService::update(const ScheduleEntry& previous, const ScheduleEntry& entry) {
    registrar_.remove(previous);
    if (!wake_.cancel(previous)) {
        std::cerr << "[warn] failed to cancel previous wake schedule\n";
    }
    store_.update(entry);
    registrar_.install(entry);
    wake_.schedule(entry, entry.wake_time);
}

ScheduleEntry ScheduleService::remove(const std::string& id) {
    ScheduleEntry current = store_.find(id);
    registrar_.remove(current);
    if (!wake_.cancel(current)) {
        std::cerr << "[warn] failed to cancel wake schedule\n";
    }
    return store_.remove(id);
}

} // namespace wakeprompt
