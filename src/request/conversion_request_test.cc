// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "request/conversion_request.h"

#include "composer/composing_text.h"
#include "protocol/config.pb.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace {

TEST(ConversionRequestTest, Default) {
  const ConversionRequest request;
  EXPECT_EQ(request.key(), "");
  EXPECT_EQ(request.left_context(), "");
  EXPECT_FALSE(request.options().llm_enabled);
  EXPECT_EQ(request.options().inference_limit, 1);
}

TEST(ConversionRequestTest, Builder) {
  composer::ComposingText composing_text;
  composing_text.Append("kyouk");

  ConversionRequest::Options options;
  options.dictionary_dir = "/opt/kanabridge/Dictionary";
  options.memory_dir = "/home/user/.config/kanabridge/memory";

  config::Config config;
  config.mutable_engine()->set_enabled(true);
  config.mutable_engine()->set_profile("丁寧語");
  config.mutable_engine()->set_inference_limit(4);

  const ConversionRequest request = ConversionRequestBuilder()
                                        .SetComposingText(composing_text)
                                        .SetLeftContext("明日は")
                                        .SetOptions(options)
                                        .SetConfig(config)
                                        .Build();
  EXPECT_EQ(request.key(), "きょうk");
  EXPECT_EQ(request.left_context(), "明日は");
  EXPECT_TRUE(request.options().llm_enabled);
  EXPECT_EQ(request.options().inference_limit, 4);
  EXPECT_EQ(request.options().profile, "丁寧語");
  EXPECT_EQ(request.options().dictionary_dir, "/opt/kanabridge/Dictionary");
  EXPECT_EQ(request.options().memory_dir,
            "/home/user/.config/kanabridge/memory");
}

TEST(ConversionRequestTest, SetKeyOverridesComposingText) {
  composer::ComposingText composing_text;
  composing_text.Append("a");
  const ConversionRequest request = ConversionRequestBuilder()
                                        .SetComposingText(composing_text)
                                        .SetKey("い")
                                        .Build();
  EXPECT_EQ(request.key(), "い");
}

}  // namespace
}  // namespace kanabridge
