#include "application/OverlapLayoutService.hpp"
#include "application/SelectionFilter.hpp"
#include "utils/Color.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace holdings::application {

namespace {

constexpr double kZoneOpacity = 0.4;
constexpr double kAssetOpacity = 0.85;
constexpr double kLegendMarkerSize = 15.0;
constexpr double kOverlayOffset = 0.12;

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string usd(double value) {
    return "$" + fixed(value, 2);
}

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

OverlapLayoutService::OverlapLayoutService(std::shared_ptr<settings::LayoutSettings> settings)
    : settings_(std::move(settings))
{
    std::cout << "[OverlapLayoutService] Created" << std::endl;
}

std::string OverlapLayoutService::entityColor(std::size_t rank) {
    return kEntityPalette[rank % kEntityPalette.size()];
}

domain::LayoutScene OverlapLayoutService::layout(const domain::HoldingsIndex& index,
                                                 const domain::Selection& selection) const {
    domain::LayoutScene scene;

    auto entities = SelectionFilter::entities(index, selection.entities);
    auto assets = SelectionFilter::assets(index, selection.assets);
    if (entities.empty() || assets.empty()) {
        return scene;
    }

    double selectedTotal = 0.0;
    for (const auto* entity : entities) {
        selectedTotal += entity->totalValue;
    }

    std::vector<Anchor> anchors = placeEntities(std::move(entities));

    for (const auto& anchor : anchors) {
        scene.elements.push_back(makeEntityZone(anchor));
    }
    for (const auto& anchor : anchors) {
        scene.elements.push_back(makeEntityLabel(anchor));
    }

    std::vector<AssetPlacement> placements;
    placements.reserve(assets.size());
    for (const auto* asset : assets) {
        std::vector<const Anchor*> holders;
        for (const auto& anchor : anchors) {
            if (anchor.entity->holds(asset->symbol)) {
                holders.push_back(&anchor);
            }
        }
        if (holders.empty()) {
            continue;
        }
        placements.push_back(placeAsset(*asset, holders, selectedTotal));
    }

    // Крупные рисуются первыми, мелкие оказываются сверху
    std::stable_sort(placements.begin(), placements.end(),
                     [](const AssetPlacement& a, const AssetPlacement& b) {
                         return a.drawnSize > b.drawnSize;
                     });

    for (const auto& placement : placements) {
        scene.elements.push_back(makeAssetBubble(placement));
        scene.elements.push_back(makeAssetLabel(placement));
        if (placement.drawnSize > settings_->getOverlayMinSize()) {
            scene.elements.push_back(makePercentageOverlay(placement));
        }
    }

    addLegend(scene);
    addGuides(scene);
    return scene;
}

std::vector<OverlapLayoutService::Anchor>
OverlapLayoutService::placeEntities(std::vector<const domain::Entity*> entities) const {
    std::stable_sort(entities.begin(), entities.end(),
                     [](const domain::Entity* a, const domain::Entity* b) {
                         return a->totalValue > b->totalValue;
                     });

    std::vector<Anchor> anchors;
    anchors.reserve(entities.size());
    for (std::size_t i = 0; i < entities.size(); ++i) {
        Anchor anchor;
        anchor.entity = entities[i];
        anchor.position = utils::anchorOnCircle(i, entities.size(), settings_->getAnchorRadius());
        anchor.color = entityColor(i);
        anchors.push_back(std::move(anchor));
    }
    return anchors;
}

OverlapLayoutService::AssetPlacement
OverlapLayoutService::placeAsset(const domain::Asset& asset,
                                 const std::vector<const Anchor*>& holders,
                                 double selectedTotal) const {
    AssetPlacement placement;
    placement.asset = &asset;
    placement.holders = holders;

    std::vector<utils::Point> points;
    std::vector<double> weights;
    points.reserve(holders.size());
    weights.reserve(holders.size());
    for (const auto* holder : holders) {
        points.push_back(holder->position);
        weights.push_back(holder->entity->valueOf(asset.symbol));
    }

    auto centroid = utils::weightedCentroid(points, weights);
    placement.position = centroid ? *centroid : utils::mean(points).value_or(utils::Point());

    placement.baseSize = std::log10(std::max(1.0, asset.totalValue)) * settings_->getAssetScale();
    placement.drawnSize = placement.baseSize * settings_->getMarkerScale();

    if (selectedTotal > 0.0) {
        double percentage = asset.totalValue / selectedTotal * 100.0;
        placement.percentage = std::min(100.0, std::max(0.0, percentage));
    }
    return placement;
}

domain::SceneElement OverlapLayoutService::makeEntityZone(const Anchor& anchor) const {
    const auto& entity = *anchor.entity;

    domain::SceneElement zone;
    zone.kind = domain::ElementKind::ENTITY_ZONE;
    zone.id = entity.name;
    zone.position = anchor.position;
    zone.size = std::max(std::sqrt(entity.totalValue) * settings_->getZoneScale(),
                         settings_->getZoneMinSize());
    zone.color = utils::lightenColor(anchor.color, settings_->getZoneLighten());
    zone.outlineColor = anchor.color;
    zone.opacity = kZoneOpacity;
    zone.text = entity.name;
    zone.tooltip = entity.name + "\nTotal Holdings: " + usd(entity.totalValue);
    return zone;
}

domain::SceneElement OverlapLayoutService::makeEntityLabel(const Anchor& anchor) const {
    domain::SceneElement label;
    label.kind = domain::ElementKind::ENTITY_LABEL;
    label.id = anchor.entity->name;
    label.position = anchor.position;
    label.size = 16.0;
    label.color = "black";
    label.text = upper(anchor.entity->name);
    return label;
}

domain::SceneElement OverlapLayoutService::makeAssetBubble(const AssetPlacement& placement) const {
    domain::PercentageTier tier = domain::tierForPercentage(placement.percentage);

    domain::SceneElement bubble;
    bubble.kind = domain::ElementKind::ASSET_BUBBLE;
    bubble.id = placement.asset->symbol;
    bubble.position = placement.position;
    bubble.size = placement.drawnSize;
    bubble.color = domain::tierColor(tier);
    bubble.outlineColor = "rgba(0,0,0,0.5)";
    bubble.opacity = kAssetOpacity;
    bubble.text = placement.asset->symbol;
    bubble.tooltip = assetTooltip(placement);
    bubble.tier = tier;
    bubble.percentage = placement.percentage;
    bubble.multiHolder = placement.holders.size() > 1;
    return bubble;
}

domain::SceneElement OverlapLayoutService::makeAssetLabel(const AssetPlacement& placement) const {
    domain::SceneElement label;
    label.kind = domain::ElementKind::ASSET_LABEL;
    label.id = placement.asset->symbol;
    label.position = placement.position;
    label.size = 11.0;
    label.color = "white";
    label.text = placement.asset->symbol + "\n" + fixed(placement.percentage, 1) + "%";
    label.percentage = placement.percentage;
    return label;
}

domain::SceneElement OverlapLayoutService::makePercentageOverlay(const AssetPlacement& placement) const {
    domain::SceneElement overlay;
    overlay.kind = domain::ElementKind::PERCENTAGE_OVERLAY;
    overlay.id = placement.asset->symbol;
    overlay.position = utils::Point(placement.position.x,
                                    placement.position.y + placement.baseSize * kOverlayOffset);
    overlay.size = 10.0;
    overlay.color = "white";
    overlay.text = fixed(placement.percentage, 1) + "%";
    overlay.percentage = placement.percentage;
    return overlay;
}

std::string OverlapLayoutService::assetTooltip(const AssetPlacement& placement) const {
    const auto& asset = *placement.asset;

    std::ostringstream ss;
    ss << asset.symbol << "\n"
       << "Total Value: " << usd(asset.totalValue) << "\n"
       << "Market Share: " << fixed(placement.percentage, 2) << "%\n"
       << "Quantity: " << fixed(asset.totalQuantity, 4) << "\n"
       << "Held by: ";
    for (std::size_t i = 0; i < placement.holders.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << placement.holders[i]->entity->name;
    }
    ss << "\n---";

    std::vector<std::pair<std::string, double>> breakdown;
    for (const auto* holder : placement.holders) {
        breakdown.emplace_back(holder->entity->name, holder->entity->valueOf(asset.symbol));
    }
    std::stable_sort(breakdown.begin(), breakdown.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    for (const auto& [name, value] : breakdown) {
        double share = asset.totalValue > 0.0 ? value / asset.totalValue * 100.0 : 0.0;
        ss << "\n" << name << ": " << usd(value) << " (" << fixed(share, 1) << "%)";
    }
    return ss.str();
}

void OverlapLayoutService::addLegend(domain::LayoutScene& scene) const {
    for (auto tier : domain::kAllPercentageTiers) {
        domain::SceneElement entry;
        entry.kind = domain::ElementKind::LEGEND_ENTRY;
        entry.id = "tier-" + domain::toString(tier);
        entry.size = kLegendMarkerSize;
        entry.color = domain::tierColor(tier);
        entry.outlineColor = "black";
        entry.opacity = kAssetOpacity;
        entry.text = "Market Share: " + domain::tierLabel(tier);
        entry.tier = tier;
        scene.legend.push_back(std::move(entry));
    }

    domain::SceneElement multi;
    multi.kind = domain::ElementKind::LEGEND_ENTRY;
    multi.id = "multi-holder";
    multi.size = kLegendMarkerSize;
    multi.color = kMultiHolderColor;
    multi.outlineColor = "black";
    multi.opacity = kAssetOpacity;
    multi.text = "Asset held by multiple market makers";
    multi.multiHolder = true;
    scene.legend.push_back(std::move(multi));
}

void OverlapLayoutService::addGuides(domain::LayoutScene& scene) const {
    for (double radius : {6.0, 3.0}) {
        domain::SceneElement guide;
        guide.kind = domain::ElementKind::GUIDE_SHAPE;
        guide.id = "circle-" + fixed(radius, 0);
        guide.size = radius;
        guide.outlineColor = "rgba(0,0,0,0.1)";
        guide.color = "none";
        scene.guides.push_back(std::move(guide));
    }

    scene.annotations.push_back(domain::Annotation{
        utils::Point(0.0, -6.8),
        "Bubble size represents the value of crypto assets held",
        12.0,
        "rgba(0,0,0,0.6)"});
    scene.annotations.push_back(domain::Annotation{
        utils::Point(0.0, -7.3),
        "Data sourced from " + settings_->getSourceLabel(),
        10.0,
        "rgba(0,0,0,0.5)"});
}

} // namespace holdings::application
