#include "drivescore/report/report.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

#include "drivescore/common/time.hpp"

namespace drivescore::report {

namespace {

constexpr int kPrecision = 4;

template <typename T>
void write_optional(std::ostringstream& oss, const std::optional<T>& value)
{
    if (value) {
        oss << *value;
    } else {
        oss << "null";
    }
}

void write_breakdown(std::ostringstream& oss, const detection::FuelWasteBreakdown& waste)
{
    oss << '{';
    bool first = true;
    for (const auto category : detection::kAllBehaviorCategories) {
        oss << (first ? "" : ",") << '\"' << detection::category_to_string(category) << "\":" << waste[category];
        first = false;
    }
    oss << '}';
}

void write_event(std::ostringstream& oss, const detection::BehaviorEvent& event)
{
    const auto& ctx = event.context;
    oss << '{'
        << "\"vehicle_id\":" << quote(event.vehicle_id) << ','
        << "\"timestamp\":" << quote(time::to_iso8601(event.timestamp)) << ','
        << "\"category\":\"" << detection::category_to_string(event.category) << "\","
        << "\"severity\":\"" << detection::severity_to_string(event.severity) << "\","
        << "\"value\":" << event.value << ','
        << "\"threshold\":" << event.threshold << ','
        << "\"duration_s\":" << event.duration_s << ','
        << "\"fuel_waste_gal\":" << event.fuel_waste_gal << ',';

    oss << "\"context\":{"
        << "\"source\":\"" << detection::source_to_string(ctx.source) << "\","
        << "\"device_count\":";
    write_optional(oss, ctx.device_count);
    oss << ",\"gear\":";
    write_optional(oss, ctx.gear);
    oss << ",\"speed_mph\":";
    write_optional(oss, ctx.speed_mph);
    oss << ",\"mph_over\":";
    write_optional(oss, ctx.mph_over);
    oss << ",\"unit\":" << quote(ctx.unit) << ",\"message\":" << quote(ctx.message) << "}}";
}

void write_score(std::ostringstream& oss, const scoring::HeavyFootScore& score)
{
    const auto& sub = score.sub_scores;
    oss << '{'
        << "\"vehicle_id\":" << quote(score.vehicle_id) << ','
        << "\"timestamp\":" << quote(time::to_iso8601(score.timestamp)) << ','
        << "\"score\":" << score.overall << ','
        << "\"grade\":\"" << score.grade << "\",";

    oss << "\"components\":{"
        << "\"acceleration\":" << sub.acceleration << ','
        << "\"braking\":" << sub.braking << ','
        << "\"rpm\":" << sub.rpm << ','
        << "\"gear\":" << sub.gear << ','
        << "\"speed\":" << sub.speed << "},";

    oss << "\"behaviors\":{"
        << "\"hard_accel_count\":" << score.hard_accel_count << ','
        << "\"hard_brake_count\":" << score.hard_brake_count << ','
        << "\"high_rpm_minutes\":" << score.high_rpm_minutes << ','
        << "\"wrong_gear_minutes\":" << score.wrong_gear_minutes << ','
        << "\"overspeeding_minutes\":" << score.overspeeding_minutes << "},";

    oss << "\"fuel_waste\":{\"total_gal\":" << score.total_fuel_waste_gal << ",\"breakdown\":";
    write_breakdown(oss, score.fuel_waste);
    oss << "},";

    oss << "\"period_hours\":" << score.period_hours << ','
        << "\"driving_hours\":" << score.driving_hours << '}';
}

void write_scores(std::ostringstream& oss, const std::vector<scoring::HeavyFootScore>& scores)
{
    oss << '[';
    for (std::size_t i = 0; i < scores.size(); ++i) {
        if (i != 0) {
            oss << ',';
        }
        write_score(oss, scores[i]);
    }
    oss << ']';
}

std::ostringstream make_stream()
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(kPrecision);
    return oss;
}

} // namespace

std::string quote(const std::string& text)
{
    std::ostringstream oss;
    oss << '\"';
    for (const char c : text) {
        switch (c) {
            case '\"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '\"';
    return oss.str();
}

std::string to_json(const detection::BehaviorEvent& event)
{
    auto oss = make_stream();
    write_event(oss, event);
    return oss.str();
}

std::string to_json(const std::vector<detection::BehaviorEvent>& events)
{
    auto oss = make_stream();
    oss << '[';
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (i != 0) {
            oss << ',';
        }
        write_event(oss, events[i]);
    }
    oss << ']';
    return oss.str();
}

std::string to_json(const scoring::HeavyFootScore& score)
{
    auto oss = make_stream();
    write_score(oss, score);
    return oss.str();
}

std::string to_json(const validation::MpgCrossValidation& result)
{
    auto oss = make_stream();
    oss << '{'
        << "\"vehicle_id\":" << quote(result.vehicle_id) << ','
        << "\"timestamp\":" << quote(time::to_iso8601(result.timestamp)) << ','
        << "\"kalman_mpg_avg\":" << result.kalman_mpg_avg << ','
        << "\"ecu_mpg_avg\":" << result.ecu_mpg_avg << ','
        << "\"difference_pct\":" << result.difference_pct << ','
        << "\"is_valid\":" << (result.is_valid ? "true" : "false") << ','
        << "\"recommendation\":" << quote(result.recommendation) << '}';
    return oss.str();
}

std::string to_json(const fleet::FleetSummary& summary)
{
    auto oss = make_stream();
    oss << '{'
        << "\"fleet_size\":" << summary.fleet_size << ','
        << "\"average_score\":" << summary.average_score << ','
        << "\"needs_work_count\":" << summary.needs_work_count << ','
        << "\"best_performers\":";
    write_scores(oss, summary.best);
    oss << ",\"worst_performers\":";
    write_scores(oss, summary.worst);

    oss << ",\"total_fuel_waste_gal\":" << summary.total_fuel_waste_gal << ",\"waste_breakdown\":";
    write_breakdown(oss, summary.fuel_waste);

    oss << ",\"behavior_scores\":{";
    bool first = true;
    for (const auto category : detection::kAllBehaviorCategories) {
        oss << (first ? "" : ",") << '\"' << detection::category_to_string(category)
            << "\":" << summary.behavior_scores[static_cast<std::size_t>(category)];
        first = false;
    }
    oss << "},";

    oss << "\"biggest_issue\":{"
        << "\"category\":\"" << detection::category_to_string(summary.biggest_issue) << "\","
        << "\"gallons\":" << summary.biggest_issue_gal << "},";

    oss << "\"recommendations\":[";
    for (std::size_t i = 0; i < summary.recommendations.size(); ++i) {
        oss << (i == 0 ? "" : ",") << quote(summary.recommendations[i]);
    }
    oss << "]}";
    return oss.str();
}

std::string to_json(const std::vector<fleet::CoachingTip>& tips)
{
    auto oss = make_stream();
    oss << '[';
    for (std::size_t i = 0; i < tips.size(); ++i) {
        const auto& tip = tips[i];
        oss << (i == 0 ? "" : ",") << '{'
            << "\"category\":"
            << (tip.category ? quote(detection::category_to_string(*tip.category)) : std::string("\"overall_grade\""))
            << ','
            << "\"tier\":\"" << fleet::tier_to_string(tip.tier) << "\","
            << "\"priority\":" << tip.priority << ','
            << "\"score\":" << tip.score << ','
            << "\"message\":" << quote(tip.message) << '}';
    }
    oss << ']';
    return oss.str();
}

} // namespace drivescore::report
