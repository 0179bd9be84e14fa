#include "chart/Chart.hpp"
#include "config/ChartOptions.hpp"
#include "data/KLineDataParser.hpp"
#include "format/KlineFormat.hpp"
#include "KlineLogging.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::string priceText(const ChartStore& store, double price, bool present) {
    if (!present) return "--";
    return KlineFormat::formatThousands(KlineFormat::formatPrecision(price, store.precision().price),
                                        store.thousandsSeparator());
}

void printState(const Chart& chart, const char* step) {
    const ChartStore& store = chart.store();
    const HighLowPrice& hl = store.visibleRangeHighLowPrice();
    const VisibleRange range = chart.timeScale().visibleRange();
    fmt::print("{:<14} bars={:<6} range=[{},{}) high={:>12} low={:>12} loading={}\n",
               step, store.dataList().size(), range.realFrom, range.realTo,
               priceText(store, hl.high.price, hl.hasHigh()),
               priceText(store, hl.low.price, hl.hasLow()),
               store.isLoading());
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("kline_replay");

    QCommandLineParser parser;
    parser.setApplicationDescription("Replays a JSON bar file through a chart data core.");
    parser.addHelpOption();
    parser.addPositionalArgument("bars", "JSON array of bars.");
    parser.addPositionalArgument("options", "Optional JSON chart options.", "[options]");
    QCommandLineOption initOpt("init", "Bars in the initial load.", "count", "100");
    QCommandLineOption liveOpt("live", "Bars replayed as live updates.", "count", "20");
    QCommandLineOption pageOpt("page", "Bars per load-more page.", "count", "50");
    QCommandLineOption widthOpt("width", "Viewport width in pixels.", "px", "800");
    QCommandLineOption delayOpt("delay", "Milliseconds between steps.", "ms", "10");
    parser.addOptions({initOpt, liveOpt, pageOpt, widthOpt, delayOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    std::ifstream in(args.at(0).toStdString());
    if (!in) {
        fmt::print(stderr, "cannot open {}\n", args.at(0).toStdString());
        return 1;
    }
    const nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        fmt::print(stderr, "{} is not valid JSON\n", args.at(0).toStdString());
        return 1;
    }
    ParseResult parsed = KLineDataParser::parse(doc);
    if (parsed.skipped > 0) {
        kLog_Warning("kline_replay: skipped" << parsed.skipped << "malformed rows");
    }
    std::vector<KLineData> bars = std::move(parsed.bars);
    std::sort(bars.begin(), bars.end(),
              [](const KLineData& a, const KLineData& b) { return a.timestamp < b.timestamp; });
    if (bars.empty()) {
        fmt::print(stderr, "no bars in {}\n", args.at(0).toStdString());
        return 1;
    }

    ChartOptions options;
    if (args.size() > 1) {
        auto loaded = ChartOptions::loadFromFile(args.at(1).toStdString());
        if (!loaded) {
            fmt::print(stderr, "cannot read options {}\n", args.at(1).toStdString());
            return 1;
        }
        options = std::move(*loaded);
    }

    const std::size_t liveCount = std::min<std::size_t>(parser.value(liveOpt).toULongLong(), bars.size() - 1);
    const std::size_t historyEnd = bars.size() - liveCount;
    const std::size_t initCount = std::clamp<std::size_t>(parser.value(initOpt).toULongLong(), 1, historyEnd);
    const std::size_t pageSize = std::max<qulonglong>(1, parser.value(pageOpt).toULongLong());
    const int delayMs = std::max(0, parser.value(delayOpt).toInt());

    Chart chart(options);
    chart.resize(parser.value(widthOpt).toDouble());

    // Older history is served from the front of the file, one page per request
    auto olderEnd = std::make_shared<std::size_t>(historyEnd - initCount);
    chart.setLoadMoreDataCallback([&chart, &bars, olderEnd, pageSize, delayMs](const LoadDataParams& params) {
        auto respond = params.callback;
        if (params.type == LoadDataType::Backward) {
            // Newer bars arrive as live updates, never as pages
            QTimer::singleShot(delayMs, &chart, [respond]() { respond({}, false); });
            return;
        }
        const std::size_t end = *olderEnd;
        const std::size_t begin = end > pageSize ? end - pageSize : 0;
        *olderEnd = begin;
        std::vector<KLineData> page(bars.begin() + static_cast<std::ptrdiff_t>(begin),
                                    bars.begin() + static_cast<std::ptrdiff_t>(end));
        const bool more = begin > 0;
        QTimer::singleShot(delayMs, &chart, [&chart, respond, page = std::move(page), more]() {
            respond(page, more);
            printState(chart, "forward page");
        });
    });

    std::vector<KLineData> initial(bars.begin() + static_cast<std::ptrdiff_t>(historyEnd - initCount),
                                   bars.begin() + static_cast<std::ptrdiff_t>(historyEnd));
    chart.applyNewData(std::move(initial), historyEnd > initCount);
    printState(chart, "init");

    // Live replay: each bar arrives once still forming, then closed
    std::size_t next = historyEnd;
    QTimer liveTimer;
    liveTimer.setInterval(delayMs);
    QObject::connect(&liveTimer, &QTimer::timeout, &app, [&]() {
        if (next >= bars.size()) {
            liveTimer.stop();
            if (!chart.store().isLoading()) {
                app.quit();
            } else {
                QTimer::singleShot(delayMs * 10 + 100, &app, &QCoreApplication::quit);
            }
            return;
        }
        KLineData forming = bars[next];
        forming.close = forming.open;
        forming.high = std::max(forming.open, forming.low);
        if (chart.updateData(forming) == AddDataResult::StaleDropped) {
            kLog_Warning("kline_replay: bar" << forming.timestamp << "out of order");
        }
        const AddDataResult result = chart.updateData(bars[next]);
        printState(chart, addDataResultName(result));
        ++next;
    });
    liveTimer.start();

    return app.exec();
}
