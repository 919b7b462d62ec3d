// include/HoldingsApp.hpp
#pragma once

#include <boost/di.hpp>
#include <nlohmann/json.hpp>

// Settings
#include "settings/ISourceSettings.hpp"
#include "settings/SourceSettings.hpp"
#include "settings/LayoutSettings.hpp"
#include "settings/SelectionSettings.hpp"

// Ports
#include "ports/input/IAggregationService.hpp"
#include "ports/input/ILayoutService.hpp"
#include "ports/input/IReportService.hpp"
#include "ports/output/IHoldingsSource.hpp"
#include "ports/output/ISnapshotCache.hpp"

// Application
#include "application/HoldingsAggregator.hpp"
#include "application/OverlapLayoutService.hpp"
#include "application/HoldingsReportService.hpp"

// Secondary Adapters
#include "adapters/secondary/JsonFileHoldingsSource.hpp"
#include "adapters/secondary/CachedHoldingsSource.hpp"
#include "adapters/secondary/InMemorySnapshotCache.hpp"

// Primary Adapters
#include "adapters/primary/IndexJsonPresenter.hpp"
#include "adapters/primary/SceneJsonPresenter.hpp"
#include "adapters/primary/ReportJsonPresenter.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace di = boost::di;

namespace holdings
{

    /**
     * @brief Holdings Overlap Application
     *
     * Снимок -> агрегация -> выбор -> сцена + отчёты -> JSON.
     * Template Method: run() вызывает loadEnvironment(), configureInjection(), start().
     */
    class HoldingsApp
    {
    public:
        HoldingsApp() { std::cout << "[HoldingsApp] Initializing..." << std::endl; }
        virtual ~HoldingsApp() { std::cout << "[HoldingsApp] Shutting down..." << std::endl; }

        int run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            return start();
        }

    protected:
        /**
         * @brief Аргументы командной строки переопределяют ENV
         *
         * --snapshot <path>  -> HOLDINGS_SNAPSHOT_PATH
         * --output <path>    -> HOLDINGS_OUTPUT_PATH
         */
        virtual void loadEnvironment(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];
                if ((arg == "--snapshot" || arg == "--output") && i + 1 < argc)
                {
                    const char *name = (arg == "--snapshot") ? "HOLDINGS_SNAPSHOT_PATH" : "HOLDINGS_OUTPUT_PATH";
                    ::setenv(name, argv[++i], 1);
                }
                else
                {
                    throw std::invalid_argument("unknown or incomplete argument: " + arg);
                }
            }
            std::cout << "[HoldingsApp] Environment loaded" << std::endl;
        }

        virtual void configureInjection()
        {
            std::cout << "[HoldingsApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::ISourceSettings>().to<settings::SourceSettings>().in(di::singleton),
                di::bind<settings::LayoutSettings>().in(di::singleton),
                di::bind<settings::SelectionSettings>().in(di::singleton),

                di::bind<ports::output::ISnapshotCache>().to<adapters::secondary::InMemorySnapshotCache>().in(di::singleton),
                di::bind<adapters::secondary::JsonFileHoldingsSource>().in(di::singleton),
                di::bind<ports::output::IHoldingsSource>().to<adapters::secondary::CachedHoldingsSource>().in(di::singleton),

                di::bind<ports::input::IAggregationService>().to<application::HoldingsAggregator>().in(di::singleton),
                di::bind<ports::input::ILayoutService>().to<application::OverlapLayoutService>().in(di::singleton),
                di::bind<ports::input::IReportService>().to<application::HoldingsReportService>().in(di::singleton));

            sourceSettings_ = injector.create<std::shared_ptr<settings::ISourceSettings>>();
            selectionSettings_ = injector.create<std::shared_ptr<settings::SelectionSettings>>();
            source_ = injector.create<std::shared_ptr<ports::output::IHoldingsSource>>();
            aggregator_ = injector.create<std::shared_ptr<ports::input::IAggregationService>>();
            layoutService_ = injector.create<std::shared_ptr<ports::input::ILayoutService>>();
            reportService_ = injector.create<std::shared_ptr<ports::input::IReportService>>();

            std::cout << "[HoldingsApp] Ready" << std::endl;
        }

        virtual int start()
        {
            auto snapshot = source_->fetchSnapshot();
            auto index = aggregator_->aggregate(snapshot);
            std::cout << "[HoldingsApp] Aggregated " << index.entities().size() << " entities, "
                      << index.assets().size() << " assets" << std::endl;

            domain::Selection selection = resolveSelection(index);
            auto scene = layoutService_->layout(index, selection);
            if (scene.empty())
            {
                std::cout << "[HoldingsApp] No data for the current selection" << std::endl;
            }

            nlohmann::ordered_json document;
            document["refreshed_at"] = snapshot.fetchedAt.toString();
            document["selection"] = {
                {"entities", selection.entities},
                {"assets", selection.assets}
            };
            document["index"] = adapters::primary::IndexJsonPresenter::toJson(index);
            document["scene"] = adapters::primary::SceneJsonPresenter::toJson(scene);
            document["report"] = adapters::primary::ReportJsonPresenter::toJson(
                reportService_->overlapMatrix(index, selection),
                reportService_->holdingsTable(index, selection),
                reportService_->summary(index, selection));

            writeDocument(document);
            return 0;
        }

    private:
        std::shared_ptr<settings::ISourceSettings> sourceSettings_;
        std::shared_ptr<settings::SelectionSettings> selectionSettings_;
        std::shared_ptr<ports::output::IHoldingsSource> source_;
        std::shared_ptr<ports::input::IAggregationService> aggregator_;
        std::shared_ptr<ports::input::ILayoutService> layoutService_;
        std::shared_ptr<ports::input::IReportService> reportService_;

        domain::Selection resolveSelection(const domain::HoldingsIndex &index) const
        {
            auto defaults = reportService_->defaultSelection(
                index,
                selectionSettings_->getDefaultEntityCount(),
                selectionSettings_->getDefaultAssetCount());

            domain::Selection selection;
            selection.entities = selectionSettings_->getEntities().empty()
                                     ? defaults.entities
                                     : selectionSettings_->getEntities();
            selection.assets = selectionSettings_->getAssets().empty()
                                   ? defaults.assets
                                   : selectionSettings_->getAssets();
            return selection;
        }

        void writeDocument(const nlohmann::ordered_json &document) const
        {
            const std::string path = sourceSettings_->getOutputPath();
            if (path.empty() || path == "-")
            {
                std::cout << document.dump(2) << std::endl;
                return;
            }

            std::ofstream out(path);
            if (!out)
            {
                throw std::runtime_error("cannot open output file: " + path);
            }
            out << document.dump(2) << std::endl;
            std::cout << "[HoldingsApp] Scene written to " << path << std::endl;
        }
    };

} // namespace holdings
