/**
 * @file AppServices.hpp
 * @brief Collaborators injected into a revision run.
 */

#pragma once

#include <memory>
#include <string>
#include "application/OperationInterpreter.hpp"
#include "domain/ImageProbe.hpp"
#include "domain/grammar/GrammarAdvisor.hpp"

namespace redliner::application {

struct AppServices {
    std::shared_ptr<domain::grammar::GrammarAdvisor> grammarAdvisor; ///< Null when the advisor is disabled.
    std::shared_ptr<domain::ImageProbe> imageProbe;
    OperationInterpreter::Settings interpreterSettings;
    std::string advisorName;
};

} // namespace redliner::application
