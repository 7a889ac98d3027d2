#include <rclcpp/rclcpp.hpp>
#include "hough_ml/nodes/hough_training_node.hpp"

int main(int argc, char* argv[]) {
    rclcpp::init(argc, argv);

    rclcpp::NodeOptions options;
    options.automatically_declare_parameters_from_overrides(false);

    auto node = std::make_shared<hough_ml::nodes::HoughTrainingNode>(options);

    rclcpp::spin(node);
    rclcpp::shutdown();

    return 0;
}
