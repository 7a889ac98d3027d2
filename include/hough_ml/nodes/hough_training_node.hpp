#ifndef HOUGH_ML_NODES_HOUGH_TRAINING_NODE_HPP
#define HOUGH_ML_NODES_HOUGH_TRAINING_NODE_HPP

#include <rclcpp/rclcpp.hpp>
#include <std_srvs/srv/trigger.hpp>

#include "hough_ml/core/charge_table.hpp"
#include "hough_ml/core/config.hpp"
#include "hough_ml/core/easing.hpp"
#include "hough_ml/core/pipeline.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace hough_ml {
namespace nodes {

class HoughTrainingNode : public rclcpp::Node {
public:
    explicit HoughTrainingNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());
    ~HoughTrainingNode() = default;

private:
    // Services
    rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr run_analysis_service_;

    // Core data
    core::AnalysisConfig config_;
    core::ChargeTable charges_;
    core::EasingRegistry easings_;
    bool run_on_startup_;

    // Serializes analysis runs
    std::mutex analysis_mutex_;

    // Service callbacks
    void runAnalysisCallback(
        const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
        std::shared_ptr<std_srvs::srv::Trigger::Response> response);

    // Load, process and save one full pass over the data directory
    core::AnalysisStatistics runAnalysis();

    // Parameter parsing
    void parseParameters();
};

} // namespace nodes
} // namespace hough_ml

#endif // HOUGH_ML_NODES_HOUGH_TRAINING_NODE_HPP
