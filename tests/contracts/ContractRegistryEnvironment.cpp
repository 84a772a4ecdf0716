#include "ContractRegistryEnvironment.h"

#include <gtest/gtest.h>

#include <map>
#include <set>
#include <sstream>
#include <utility>

#include "../ContractRegistry.h"

namespace vinefeed::tests
{

namespace
{

std::map<std::string, std::set<std::string>>& ExpectedCoverage()
{
  static std::map<std::string, std::set<std::string>> expected;
  return expected;
}

// Fails the run when a domain declared rules that no suite covered.  Only
// checked for unfiltered runs.
class ContractCoverageEnvironment : public ::testing::Environment
{
public:
  void TearDown() override
  {
    if (GTEST_FLAG_GET(filter) != "*")
    {
      return;
    }
    for (const auto& entry : ExpectedCoverage())
    {
      const std::vector<std::string> expected(entry.second.begin(), entry.second.end());
      const auto missing = ContractRegistry::Instance().MissingRules(entry.first, expected);
      if (!missing.empty())
      {
        std::ostringstream oss;
        oss << "Domain " << entry.first << " has uncovered rules:";
        for (const auto& rule : missing)
        {
          oss << " " << rule;
        }
        ADD_FAILURE() << oss.str();
      }
    }
  }
};

::testing::Environment* const kCoverageEnvironment =
    ::testing::AddGlobalTestEnvironment(new ContractCoverageEnvironment());

} // namespace

void RegisterExpectedDomainCoverage(std::string domain,
                                    std::vector<std::string> rule_ids)
{
  auto& rules = ExpectedCoverage()[std::move(domain)];
  rules.insert(rule_ids.begin(), rule_ids.end());
}

} // namespace vinefeed::tests
