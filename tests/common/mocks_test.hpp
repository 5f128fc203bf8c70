#pragma once

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "policylens_core/llm/ollama_client.hpp"
#include "utilities_test.hpp"

namespace policylens_tests {

/**
 * Mock class for OllamaClient to use in tests.
 * By default every text maps to TestUtilities::create_test_vector(text, dimension), so the
 * same text always gets the same vector whatever batch it arrives in.
 */
class MockOllamaClient : public policylens_core::OllamaClient {
 public:
  explicit MockOllamaClient(size_t dimension = TestUtilities::TEST_DIMENSION)
      : policylens_core::OllamaClient("http://localhost:11434", "all-minilm"),
        dimension_(dimension) {
    ON_CALL(*this, get_embeddings(testing::_))
        .WillByDefault([this](const std::vector<std::string> &texts) {
          std::vector<std::vector<float>> vectors;
          for (const auto &text : texts) {
            vectors.push_back(TestUtilities::create_test_vector(text, dimension_));
          }
          return vectors;
        });
    ON_CALL(*this, is_server_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<std::vector<float>>,
              get_embeddings,
              (const std::vector<std::string> &texts),
              (override));
  MOCK_METHOD(bool, is_server_available, (), (override));

 private:
  size_t dimension_;
};

}  // namespace policylens_tests
