//
// language.cpp
// This file is part of IndentProc
// Copyright (C) 2015-2018 HostileFork.com
//
// Licensed under the Boost License, Version 1.0 (the "License")
//
//      http://www.boost.org/LICENSE_1_0.txt
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied.  See the License for the specific language governing
// permissions and limitations under the License.
//

#include "indentproc/language.hpp"
#include "indentproc/trace.hpp"


namespace indentproc {

//
// BRACKET PAIR SET
//

std::vector<std::string> BracketPairSet::getOpenBrackets() const {
    std::vector<std::string> result;
    for (BracketPair const & pair : pairs)
        result.insert(result.end(), pair.open.begin(), pair.open.end());
    return result;
}


std::vector<std::string> BracketPairSet::getCloseBrackets() const {
    std::vector<std::string> result;
    for (BracketPair const & pair : pairs)
        result.insert(result.end(), pair.close.begin(), pair.close.end());
    return result;
}



//
// REGISTRY
//

bool LanguageConfigurationRegistry::registerLanguage(
    LanguageId const & languageId,
    LanguageConfiguration const & configuration
) {
    auto it = configurations.find(languageId);
    if (it == configurations.end()) {
        configurations.emplace(languageId, configuration);
        return false;
    }

    trace("language configuration for", languageId, "replaced");
    it->second = configuration;
    return true;
}


bool LanguageConfigurationRegistry::unregisterLanguage(
    LanguageId const & languageId
) {
    return configurations.erase(languageId) != 0;
}


bool LanguageConfigurationRegistry::hasLanguage(
    LanguageId const & languageId
) const {
    return configurations.find(languageId) != configurations.end();
}


optional<BracketPairSet> LanguageConfigurationRegistry::getBracketPairs(
    LanguageId const & languageId
) const {
    auto it = configurations.find(languageId);
    if (it == configurations.end())
        return nullopt;
    return it->second.brackets;
}


optional<IndentationRules> LanguageConfigurationRegistry::getIndentationRules(
    LanguageId const & languageId
) const {
    auto it = configurations.find(languageId);
    if (it == configurations.end())
        return nullopt;
    return it->second.indentationRules;
}

} // end namespace indentproc
