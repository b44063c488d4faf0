#include "hdldoc_builder.hpp"
#include <gtest/gtest.h>

using namespace hdldoc;

namespace {

using Groups = std::vector<std::optional<std::string>>;

VerilogToken tok(Action action, Groups groups = {}) {
  return VerilogToken{ 0, action, std::move(groups) };
}

ModuleList build(const std::vector<VerilogToken>& toks) {
  EntityBuilder b;
  for (const auto& t : toks) b.apply(t);
  return b.finish();
}

} // namespace

TEST(Builder, PortItemUsesActiveType) {
  auto modules = build({
    tok(Action::ModuleStart, { "m" }),
    tok(Action::PortItem, { "a" }),
    tok(Action::PortStart, { "output", "reg", std::nullopt, "[3:0]" }),
    tok(Action::PortItem, { "b" }),
    tok(Action::PortItem, { "c" }),
    tok(Action::EndModule),
  });
  ASSERT_EQ(modules.size(), 1u);
  const auto& p = modules[0].ports;
  ASSERT_EQ(p.size(), 3u);
  EXPECT_EQ(p[0], (Port{ "a", PortMode::Input, "wire", std::nullopt }));
  EXPECT_EQ(p[1], (Port{ "b", PortMode::Output, "reg [3:0]", std::nullopt }));
  EXPECT_EQ(p[2].data_type, "reg [3:0]");
}

TEST(Builder, ActiveTypeResetsPerModule) {
  auto modules = build({
    tok(Action::ModuleStart, { "a" }),
    tok(Action::PortStart, { "output", "reg", std::nullopt, std::nullopt }),
    tok(Action::PortItem, { "q" }),
    tok(Action::EndModule),
    tok(Action::ModuleStart, { "b" }),
    tok(Action::PortItem, { "d" }),
    tok(Action::EndModule),
  });
  ASSERT_EQ(modules.size(), 2u);
  EXPECT_EQ(modules[1].ports[0].mode, PortMode::Input);
  EXPECT_EQ(modules[1].ports[0].data_type, "wire");
}

TEST(Builder, SectionSlices) {
  auto modules = build({
    tok(Action::ModuleStart, { "m" }),
    tok(Action::PortItem, { "p0" }),
    tok(Action::SectionMeta, { "A" }),
    tok(Action::PortItem, { "p1" }),
    tok(Action::PortItem, { "p2" }),
    tok(Action::SectionMeta, { "B" }),
    tok(Action::PortItem, { "p3" }),
    tok(Action::SectionMeta, { "Tail" }),
    tok(Action::EndModule),
  });
  const auto& sec = modules[0].sections;
  ASSERT_EQ(sec.size(), 2u);
  EXPECT_EQ(sec.at("A"), (std::vector<std::string>{ "p1", "p2" }));
  EXPECT_EQ(sec.at("B"), (std::vector<std::string>{ "p3" }));
}

TEST(Builder, CommentAttachment) {
  auto modules = build({
    tok(Action::Metacomment, { " first line " }),
    tok(Action::Metacomment, { "" }),
    tok(Action::ModuleStart, { "m" }),
    tok(Action::Comment, { "second line" }),
    tok(Action::ParameterStart, { std::nullopt, std::nullopt }),
    tok(Action::ParamItemWithValue, { "W", " 4 " }),
    tok(Action::Comment, { "ignored" }),
    tok(Action::Metacomment, { "width" }),
    tok(Action::PortItem, { "a" }),
    tok(Action::Metacomment, { "old" }),
    tok(Action::Metacomment, { "new" }),
    tok(Action::EndModule),
  });
  const auto& m = modules[0];
  EXPECT_EQ(m.desc, std::optional<std::string>("first line\nsecond line"));
  EXPECT_EQ(m.generics[0].desc, std::optional<std::string>("width"));
  EXPECT_EQ(m.generics[0].default_value, std::optional<std::string>("4"));
  EXPECT_EQ(m.ports[0].desc, std::optional<std::string>("new"));
}

TEST(Builder, CommentsBetweenModulesDescribeTheNextOne) {
  auto modules = build({
    tok(Action::ModuleStart, { "a" }),
    tok(Action::PortItem, { "x" }),
    tok(Action::EndModule),
    tok(Action::Metacomment, { "for b" }),
    tok(Action::ModuleStart, { "b" }),
    tok(Action::EndModule),
  });
  ASSERT_EQ(modules.size(), 2u);
  EXPECT_FALSE(modules[0].ports[0].desc.has_value());
  EXPECT_EQ(modules[1].desc, std::optional<std::string>("for b"));
}

TEST(Builder, SubmoduleAssembly) {
  auto modules = build({
    tok(Action::ModuleStart, { "top" }),
    tok(Action::SubmoduleParamStart, { "fifo" }),
    tok(Action::PortConnection, { "DEPTH", "16" }),
    tok(Action::SubmoduleParamEnd, { "\\u0" }),
    tok(Action::PortConnection, { "clk", " clk " }),
    tok(Action::PortConnection, { "nc", std::nullopt }),
    tok(Action::EndSubmodule),
    tok(Action::SubmoduleStart, { "leaf", "u1" }),
    tok(Action::EndSubmodule),
    tok(Action::EndModule),
  });
  const auto& subs = modules[0].submodules;
  ASSERT_EQ(subs.size(), 2u);
  EXPECT_EQ(subs[0].module_type, "fifo");
  EXPECT_EQ(subs[0].instance_name, "u0");
  std::map<std::string, std::string> expected = { { "DEPTH", "16" }, { "clk", "clk" }, { "nc", "" } };
  EXPECT_EQ(subs[0].port_connections, expected);
  EXPECT_EQ(subs[1].instance_name, "u1");
  EXPECT_TRUE(subs[1].port_connections.empty());
}

TEST(Builder, InconsistentStreamsAreRejected) {
  {
    EntityBuilder b;
    EXPECT_THROW(b.apply(tok(Action::PortItem, { "a" })), builder_error);
  }
  {
    EntityBuilder b;
    b.apply(tok(Action::ModuleStart, { "m" }));
    EXPECT_THROW(b.apply(tok(Action::EndSubmodule)), builder_error);
  }
  {
    EntityBuilder b;
    b.apply(tok(Action::ModuleStart, { "m" }));
    b.apply(tok(Action::SubmoduleStart, { "leaf", "u0" }));
    EXPECT_THROW(b.apply(tok(Action::EndModule)), builder_error);
  }
  {
    EntityBuilder b;
    b.apply(tok(Action::ModuleStart, { "m" }));
    EXPECT_THROW(b.apply(tok(Action::ModuleStart, { "n" })), builder_error);
  }
  {
    EntityBuilder b;
    b.apply(tok(Action::ModuleStart, { "m" }));
    EXPECT_THROW(b.apply(tok(Action::SubmoduleStart, { "leaf", std::nullopt })), builder_error);
  }
  {
    EntityBuilder b;
    EXPECT_THROW(b.apply(tok(Action::EndModule)), builder_error);
  }
}

TEST(Builder, FinishWithOpenModuleIsStructural) {
  EntityBuilder b;
  b.apply(tok(Action::ModuleStart, { "m" }));
  EXPECT_THROW(b.finish(), structural_error);
}

TEST(Builder, CommentTokensOutsideModulesAreHarmless) {
  auto modules = build({
    tok(Action::BlockComment),
    tok(Action::EndComment),
    tok(Action::Metacomment, { "dangling" }),
  });
  EXPECT_TRUE(modules.empty());
}
