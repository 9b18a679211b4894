#include <chrono>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <pmx.hpp>

using namespace pmx;
using namespace std::chrono_literals;

namespace {

// Canned "remote" responses keyed by URL
const std::map<std::string, std::string> kResponses = {
    {"https://gamma.example/events?slug=us-election", R"([{"slug": "us-election"}])"},
    {"https://gamma.example/events?slug=nothing", "[]"},
    {"https://gamma.example/markets/us-election", R"(["YES", "NO")"},
    {"https://gamma.example/markets/three-way", R"(["YES", "NO", "MAYBE"])"},
    {"https://gamma.example/markets/two-way", R"(["YES", "NO"])"},
};

struct Market {
    std::string slug;
    std::vector<std::string> outcomes;
};

expected<std::string, HttpError> fetch(const std::string& url) {
    auto it = kResponses.find(url);
    if (it == kResponses.end()) {
        return unexpected<HttpError>(HttpError{http::Timeout{.url = url, .duration = 30s}});
    }
    return it->second;
}

expected<std::string, DataSourceError> find_group(const std::string& body,
                                                  const std::string& slug) {
    if (body == "[]") {
        return unexpected<DataSourceError>(
            DataSourceError{source::MarketGroupNotFound{.slug = slug}});
    }
    return slug;
}

// Just enough of a list reader for the canned payloads
expected<std::vector<std::string>, ParseError> parse_outcomes(const std::string& raw) {
    if (raw.empty() || raw.front() != '[' || raw.back() != ']') {
        return unexpected<ParseError>(ParseError{json_deserialization_failed(
            "outcomes", "list of text", raw, "unexpected end of input")});
    }

    std::vector<std::string> outcomes;
    std::size_t pos = 0;
    while ((pos = raw.find('"', pos)) != std::string::npos) {
        auto end = raw.find('"', pos + 1);
        if (end == std::string::npos) {
            break;
        }
        outcomes.push_back(raw.substr(pos + 1, end - pos - 1));
        pos = end + 1;
    }
    return outcomes;
}

expected<Market, NormalizationError> normalize_market(std::string slug,
                                                      std::vector<std::string> outcomes) {
    if (outcomes.size() != 2) {
        return unexpected<NormalizationError>(NormalizationError{normalize::OutcomeMappingFailed{
            .market_slug = std::move(slug),
            .outcomes = std::move(outcomes),
            .reason = "expected exactly two outcomes",
        }});
    }
    return Market{.slug = std::move(slug), .outcomes = std::move(outcomes)};
}

expected<double, AnalysisError> analyze(const Market& market, std::chrono::seconds age) {
    if (age > 5min) {
        return unexpected<AnalysisError>(AnalysisError{
            analysis::StaleData{.analysis_type = "price", .age = age, .max_age = 5min}});
    }
    return 1.0 / static_cast<double>(market.outcomes.size());
}

expected<void, OutputError> render(const Market& market, double probability, std::ostream& out) {
    out << market.slug << ": " << market.outcomes.front() << " @ " << probability << "\n";
    if (!out) {
        return unexpected<OutputError>(OutputError{
            output::WriteFailed{.target = "stdout", .reason = "stream in failed state"}});
    }
    return {};
}

Result<double> explore(const std::string& group, const std::string& market_slug,
                       std::chrono::seconds age, std::ostream& out = std::cout) {
    auto group_body = promote(fetch("https://gamma.example/events?slug=" + group));
    if (!group_body) {
        return unexpected<AppError>(group_body.error());
    }

    auto found = promote(find_group(*group_body, group));
    if (!found) {
        return unexpected<AppError>(found.error());
    }

    return promote(fetch("https://gamma.example/markets/" + market_slug))
        .and_then([](const std::string& raw) { return promote(parse_outcomes(raw)); })
        .and_then([&](std::vector<std::string> outcomes) {
            return promote(normalize_market(market_slug, std::move(outcomes)));
        })
        .and_then([&](const Market& market) -> Result<double> {
            auto probability = analyze(market, age);
            if (!probability) {
                return fail(probability.error());
            }
            auto written = render(market, *probability, out);
            if (!written) {
                return fail(written.error());
            }
            return *probability;
        });
}

void run_case(const std::string& title, const Result<double>& result) {
    std::cout << title << "\n";
    std::cout << std::string(title.size(), '-') << "\n";
    if (result) {
        std::cout << "ok, probability " << *result << "\n\n";
        return;
    }
    (void)present(result.error(), std::cout);
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "PMX Failure Presentation Examples\n";
    std::cout << "=================================\n\n";

    PresentationConfig config;
    auto loaded = parse_presentation_config("presentation:\n  exit_code: 2\n");
    if (loaded) {
        config = *loaded;
    } else {
        std::cerr << error_message(loaded.error()) << "\n";
    }
    set_log_level(config.log_level);

    run_case("1. Successful run", explore("us-election", "two-way", 30s));
    run_case("2. Transport failure", explore("offline", "two-way", 30s));
    run_case("3. Unknown market group", explore("nothing", "two-way", 30s));
    run_case("4. Truncated payload", explore("us-election", "us-election", 30s));
    run_case("5. Outcome mismatch", explore("us-election", "three-way", 30s));
    run_case("6. Stale data", explore("us-election", "two-way", 15min));

    std::ostringstream closed;
    closed.setstate(std::ios::badbit);
    run_case("7. Output failure", explore("us-election", "two-way", 30s, closed));

    // The outermost boundary: render the failure and leave with a non-zero status
    auto last = explore("us-election", "missing-market", 30s);
    if (!last) {
        present_and_exit(last.error(), config);
    }
    return 0;
}
