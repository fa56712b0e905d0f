#include "bookprinter.hpp"
#include "commandparser.hpp"
#include "engineconfig.hpp"
#include "eventsink.hpp"
#include "matchingengine.hpp"

#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace tickbook;

namespace {

// Writes each event to stdout as it is published
class PrintingSink : public EventSink {
public:
    explicit PrintingSink(Price priceScale) : m_priceScale(priceScale) {}

    void publish(const Event& event) override { std::cout << "  " << describe(event, m_priceScale) << std::endl; }

private:
    Price m_priceScale;
};

// Session used when no script is given; prices in thousandths
std::vector<ScriptStep> builtinSession()
{
    return {
        Command{NewLimitOrder{1, Side::Buy, 99500, 10}},
        Command{NewLimitOrder{2, Side::Buy, 99800, 5}},
        Command{NewLimitOrder{3, Side::Buy, 99500, 12}},
        Command{NewLimitOrder{4, Side::Sell, 100000, 20}},
        Command{NewLimitOrder{5, Side::Sell, 99900, 10}},
        Command{NewLimitOrder{6, Side::Sell, 100000, 3}},
        PrintBook{},
        Command{NewLimitOrder{7, Side::Sell, 99700, 8}},
        PrintBook{},
    };
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        // Configuration
        EngineConfig config;
        config.symbol = "DEMO";
        config.priceScale = 1000;

        // Parse args (minimal)
        if (argc > 1) {
            std::cout << "Loading config from " << argv[1] << "..." << std::endl;
            config = EngineConfig::loadFromFile(argv[1]);
        }

        std::vector<ScriptStep> steps = builtinSession();
        if (argc > 2) {
            std::cout << "Loading script from " << argv[2] << "..." << std::endl;
            steps = loadScript(argv[2]);
        }

        std::cout << "TickBook Matching Engine" << std::endl;

        PrintingSink sink(config.priceScale);
        MatchingEngine engine(config, &sink);

        for (const auto& step : steps) {
            if (std::holds_alternative<PrintBook>(step)) {
                printBook(std::cout, engine);
                continue;
            }

            auto result = engine.process(std::get<Command>(step));
            if (!result.ok()) {
                std::cerr << "Command rejected: " << toString(result.error) << std::endl;
            }
        }

        printBook(std::cout, engine);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
