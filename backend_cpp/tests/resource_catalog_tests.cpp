#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <tuple>
#include "catalog/ResourceCatalog.hpp"

namespace tests
{
    using namespace terrascope;
    namespace fs = std::filesystem;

    const char* const kCatalogJson = R"({
        "aws_s3_bucket": {
            "provider": "aws",
            "defaults": {
                "bucket": "my-terraform-bucket",
                "acl": "private",
                "tags": {"Environment": "Dev", "CreatedBy": "Terrascope"}
            },
            "required_fields": ["bucket"],
            "popular": true,
            "description": "AWS S3 Bucket for object storage"
        },
        "aws_instance": {
            "provider": "aws",
            "defaults": {
                "ami": "ami-0c55b159cbfafe1f0",
                "instance_type": "t2.micro",
                "tags": {"Name": "TerrascopeInstance", "Environment": "Dev"}
            },
            "required_fields": ["ami", "instance_type"],
            "popular": true,
            "description": "AWS EC2 Instance"
        },
        "azurerm_resource_group": {
            "provider": "azurerm",
            "defaults": {
                "name": "terrascope-resources",
                "location": "East US",
                "tags": {"environment": "dev"}
            },
            "required_fields": ["name", "location"],
            "popular": true,
            "description": "Azure Resource Group"
        }
    })";

    class ResourceCatalogTest : public ::testing::Test
    {
    protected:
        fs::path dir;

        void SetUp() override
        {
            std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
            std::replace(name.begin(), name.end(), '/', '_');
            dir = fs::temp_directory_path() / ("terrascope_catalog_" + name);
            fs::remove_all(dir);
            fs::create_directories(dir);
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        std::string write_file(const std::string& name, const std::string& content)
        {
            fs::path p = dir / name;
            std::ofstream(p) << content;
            return p.string();
        }

        ResourceCatalog make_catalog()
        {
            return ResourceCatalog(write_file("resources.json", kCatalogJson));
        }
    };

    TEST_F(ResourceCatalogTest, LoadsEveryTemplateInFileOrder)
    {
        ResourceCatalog catalog = make_catalog();

        ASSERT_EQ(catalog.size(), 3u);
        EXPECT_EQ(catalog.templates()[0].type, "aws_s3_bucket");
        EXPECT_EQ(catalog.templates()[1].type, "aws_instance");
        EXPECT_EQ(catalog.templates()[2].type, "azurerm_resource_group");
    }

    TEST_F(ResourceCatalogTest, GetTemplate)
    {
        ResourceCatalog catalog = make_catalog();

        auto s3 = catalog.get_template("aws_s3_bucket");
        ASSERT_TRUE(s3.has_value());
        EXPECT_EQ(s3->provider, "aws");
        EXPECT_EQ(*s3->defaults.find("bucket"), Value("my-terraform-bucket"));
        EXPECT_EQ(*s3->defaults.find("acl"), Value("private"));
        ASSERT_TRUE(s3->defaults.find("tags")->is_map());
        EXPECT_EQ(*s3->defaults.find("tags")->as_map().find("Environment"), Value("Dev"));
        EXPECT_TRUE(s3->popular);
        EXPECT_EQ(s3->description, "AWS S3 Bucket for object storage");

        EXPECT_FALSE(catalog.get_template("fake_resource").has_value());
    }

    TEST_F(ResourceCatalogTest, RequiredFields)
    {
        ResourceCatalog catalog = make_catalog();

        EXPECT_EQ(catalog.get_template("aws_s3_bucket")->required_fields, std::vector<std::string>{"bucket"});
        EXPECT_EQ(catalog.get_template("aws_instance")->required_fields,
                  (std::vector<std::string>{"ami", "instance_type"}));
        EXPECT_EQ(catalog.get_template("azurerm_resource_group")->required_fields,
                  (std::vector<std::string>{"name", "location"}));
    }

    TEST_F(ResourceCatalogTest, ListByProvider)
    {
        ResourceCatalog catalog = make_catalog();

        auto aws = catalog.list_by_provider("aws");
        ASSERT_EQ(aws.size(), 2u);
        EXPECT_EQ(aws[0].type, "aws_s3_bucket");
        EXPECT_EQ(aws[1].type, "aws_instance");

        EXPECT_EQ(catalog.list_by_provider("AzureRM").size(), 1u);
        EXPECT_TRUE(catalog.list_by_provider("fake_provider").empty());
    }

    TEST_F(ResourceCatalogTest, ListGroups)
    {
        ResourceCatalog catalog = make_catalog();
        EXPECT_EQ(catalog.list_groups(), (std::set<std::string>{"aws", "azurerm"}));
    }

    TEST_F(ResourceCatalogTest, ListPopularHonoursLimit)
    {
        ResourceCatalog catalog = make_catalog();

        EXPECT_EQ(catalog.list_popular(),
                  (std::vector<std::string>{"aws_s3_bucket", "aws_instance", "azurerm_resource_group"}));
        EXPECT_EQ(catalog.list_popular(2), (std::vector<std::string>{"aws_s3_bucket", "aws_instance"}));
        EXPECT_TRUE(catalog.list_popular(0).empty());
    }

    TEST_F(ResourceCatalogTest, EmptyObjectGivesEmptyCatalog)
    {
        ResourceCatalog catalog(write_file("empty.json", "{}"));

        EXPECT_EQ(catalog.size(), 0u);
        EXPECT_FALSE(catalog.get_template("any_resource").has_value());
        EXPECT_TRUE(catalog.list_by_provider("any_provider").empty());
        EXPECT_TRUE(catalog.list_groups().empty());
        EXPECT_TRUE(catalog.list_popular().empty());
    }

    TEST_F(ResourceCatalogTest, MissingFileDegradesToEmpty)
    {
        ResourceCatalog catalog((dir / "nope.json").string());
        EXPECT_EQ(catalog.size(), 0u);

        OpResult r = catalog.reload();
        EXPECT_FALSE(r.success);
        EXPECT_EQ(r.error, ErrorKind::CATALOG_LOAD);
    }

    TEST_F(ResourceCatalogTest, MalformedFileDegradesToEmpty)
    {
        ResourceCatalog catalog(write_file("bad.json", "{ \"aws_s3_bucket\": { \"provider\": "));
        EXPECT_EQ(catalog.size(), 0u);
        EXPECT_EQ(catalog.reload().error, ErrorKind::CATALOG_LOAD);

        ResourceCatalog array_root(write_file("array.json", "[1, 2, 3]"));
        EXPECT_EQ(array_root.size(), 0u);
    }

    TEST_F(ResourceCatalogTest, InvalidTemplateIsSkipped)
    {
        ResourceCatalog catalog(write_file("partial.json", R"({
            "good": {"provider": "aws", "defaults": {"a": 1}},
            "bad": {"provider": "aws", "defaults": {"a": null}},
            "worse": "not an object"
        })"));

        EXPECT_EQ(catalog.size(), 1u);
        EXPECT_TRUE(catalog.get_template("good").has_value());
        EXPECT_FALSE(catalog.get_template("bad").has_value());
    }

    TEST_F(ResourceCatalogTest, ReloadPicksUpChanges)
    {
        std::string path = write_file("resources.json", "{}");
        ResourceCatalog catalog(path);
        EXPECT_EQ(catalog.size(), 0u);

        write_file("resources.json", kCatalogJson);
        EXPECT_TRUE(catalog.reload().success);
        EXPECT_EQ(catalog.size(), 3u);
    }

    class ProviderCountTest : public ResourceCatalogTest,
                              public ::testing::WithParamInterface<std::tuple<std::string, size_t>>
    {
    };

    TEST_P(ProviderCountTest, CountsTemplatesPerProvider)
    {
        ResourceCatalog catalog = make_catalog();
        EXPECT_EQ(catalog.list_by_provider(std::get<0>(GetParam())).size(), std::get<1>(GetParam()));
    }

    INSTANTIATE_TEST_SUITE_P(Providers, ProviderCountTest,
                             ::testing::Values(std::make_tuple(std::string("aws"), size_t{2}),
                                               std::make_tuple(std::string("azurerm"), size_t{1}),
                                               std::make_tuple(std::string("gcp"), size_t{0})));

    // The catalog shipped in data/
    TEST(BundledCatalog, CoversBothClouds)
    {
        std::string path = std::string(TERRASCOPE_SOURCE_DIR) + "/data/resources.json";
        ASSERT_TRUE(fs::exists(path)) << path;

        ResourceCatalog catalog(path);
        EXPECT_GE(catalog.list_by_provider("aws").size(), 10u);
        EXPECT_GE(catalog.list_by_provider("azurerm").size(), 10u);

        std::set<std::string> providers;
        for (const auto& type : catalog.list_popular())
        {
            providers.insert(catalog.get_template(type)->provider);
        }
        EXPECT_TRUE(providers.count("aws"));
        EXPECT_TRUE(providers.count("azurerm"));

        for (const auto& t : catalog.templates())
        {
            EXPECT_FALSE(t.provider.empty()) << t.type;
            EXPECT_FALSE(t.description.empty()) << t.type;
            EXPECT_FALSE(t.required_fields.empty()) << t.type;
        }
    }
}
