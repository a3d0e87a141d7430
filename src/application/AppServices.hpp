/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/TaskService.hpp"
#include "application/TcrService.hpp"

namespace taskwalker::application {

struct AppServices {
    std::unique_ptr<TaskService> taskService;
    std::unique_ptr<TcrService> tcrService;
};

} // namespace taskwalker::application
