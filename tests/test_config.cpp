#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "engage/config.hpp"
#include "engage/templates.hpp"

using namespace engage;

namespace {

class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count())))
    {
        std::filesystem::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    void write(const std::string& relative, const std::string& content) const
    {
        std::ofstream out(path_ / relative);
        out << content;
    }

private:
    std::filesystem::path path_;
};

void writeSwatch(const std::filesystem::path& path, int cols, int rows)
{
    cv::Mat image(rows, cols, CV_8UC3, cv::Scalar(10, 200, 30));
    ASSERT_TRUE(cv::imwrite(path.string(), image));
}

}  // namespace

TEST(ConfigTest, DefaultsApplyWhenSectionsAreOmitted)
{
    AppConfig config = parseConfig(Json::parse(R"({"locator": {"templates": "t.yaml"}})"), "/opt/engage");

    EXPECT_EQ(config.service.name, "engage");
    EXPECT_EQ(config.device.width, 1080);
    EXPECT_EQ(config.device.height, 1920);
    EXPECT_EQ(config.device.post_button, (Point{980, 350}));
    EXPECT_EQ(config.device.repost_option, (Point{230, 1440}));
    EXPECT_EQ(config.timing.open_like, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.timing.open_follow, std::chrono::milliseconds(8000));
    EXPECT_EQ(config.timing.after_scroll, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.locator.max_retry, 3);
    EXPECT_EQ(config.locator.dedup_radius, 50);
    EXPECT_EQ(config.locator.templates, "/opt/engage/t.yaml");
    EXPECT_EQ(config.thread_pool_size, 1);
    EXPECT_EQ(config.mqtt.port, 1883);
}

TEST(ConfigTest, ReadsDeviceProfileAndTiming)
{
    const char* text = R"({
        "device": {
            "name": "720x1600",
            "width": 720,
            "height": 1600,
            "post_button": [650, 240],
            "repost_option": {"x": 150, "y": 1200},
            "swipe": {"from_y": 1200, "to_y": 400, "duration_ms": 300},
            "profile_url_base": "https://twitter.com/"
        },
        "timing": {"open_like": 0, "after_scroll": 250},
        "locator": {"templates": "/abs/templates.yaml", "max_retry": 5, "grayscale": true},
        "debug": {"capture_dir": "captures"},
        "thread_pool_size": 4
    })";

    AppConfig config = parseConfig(Json::parse(text), "/srv/engage");

    EXPECT_EQ(config.device.name, "720x1600");
    EXPECT_EQ(config.device.post_button, (Point{650, 240}));
    EXPECT_EQ(config.device.repost_option, (Point{150, 1200}));
    EXPECT_EQ(config.device.swipe.from, (Point{540, 1200}));
    EXPECT_EQ(config.device.swipe.to, (Point{540, 400}));
    EXPECT_EQ(config.device.swipe.duration_ms, 300);
    EXPECT_EQ(config.device.profile_url_base, "https://twitter.com/");
    EXPECT_EQ(config.timing.open_like, std::chrono::milliseconds(0));
    EXPECT_EQ(config.timing.after_scroll, std::chrono::milliseconds(250));
    EXPECT_EQ(config.timing.open_comment, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.locator.templates, "/abs/templates.yaml");
    EXPECT_EQ(config.locator.max_retry, 5);
    EXPECT_TRUE(config.locator.grayscale);
    EXPECT_EQ(config.debug.capture_dir, "/srv/engage/captures");
    EXPECT_EQ(config.thread_pool_size, 4);
}

TEST(ConfigTest, RejectsInvalidValues)
{
    EXPECT_THROW(parseConfig(Json::parse("{}"), "."), std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse("[]"), "."), std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse(R"({"locator": {"max_retry": 0}})"), "."), std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse(R"({"locator": {}, "timing": {"after_tap": -1}})"), "."),
                 std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse(R"({"locator": {}, "device": {"width": 0}})"), "."),
                 std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse(R"({"locator": {}, "device": {"post_button": [1]}})"), "."),
                 std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse(R"({"locator": {}, "thread_pool_size": 0})"), "."),
                 std::runtime_error);
    EXPECT_THROW(parseConfig(Json::parse(R"({"locator": {"max_retry": "three"}})"), "."), std::runtime_error);
}

TEST(ConfigTest, LoadConfigResolvesPathsAgainstFileLocation)
{
    TempDir dir("engage_config");
    dir.write("engage.config.json", R"({"version": "2.1", "locator": {"templates": "templates.yaml"}})");

    AppConfig config = loadConfig((dir.path() / "engage.config.json").string());

    EXPECT_EQ(config.version, "2.1");
    EXPECT_EQ(std::filesystem::path(config.locator.templates).filename(), "templates.yaml");
    EXPECT_EQ(std::filesystem::path(config.locator.templates).parent_path(),
              std::filesystem::absolute(dir.path()).lexically_normal());
}

TEST(ConfigTest, SnapshotCarriesServiceAndLocatorSettings)
{
    AppConfig config = parseConfig(Json::parse(R"({"service": {"name": "phones"}, "locator": {"max_retry": 4}})"), ".");

    Json snapshot = configSnapshot(config);

    EXPECT_EQ(snapshot["service_name"].as_string(), "phones");
    EXPECT_EQ(snapshot["locator"]["max_retry"].as_int(), 4);
    EXPECT_EQ(snapshot["device"]["post_button"]["x"].as_int(), 980);
}

TEST(ConfigTest, ZeroTimingHasNoWaits)
{
    Timing timing = Timing::zero();
    EXPECT_EQ(timing.open_like.count(), 0);
    EXPECT_EQ(timing.open_follow.count(), 0);
    EXPECT_EQ(timing.after_retweet_button.count(), 0);
}

TEST(TemplateManifestTest, LoadsTemplatesWithDefaultAndOverrideThresholds)
{
    TempDir dir("engage_manifest");
    std::filesystem::create_directories(dir.path() / "img");
    writeSwatch(dir.path() / "img" / "like.png", 32, 24);
    writeSwatch(dir.path() / "img" / "repost.png", 60, 20);
    dir.write("templates.yaml",
              "default_threshold: 0.7\n"
              "templates:\n"
              "  - name: like_button\n"
              "    path: img/like.png\n"
              "  - name: repost_option\n"
              "    path: img/repost.png\n"
              "    threshold: 0.8\n");

    TemplateLibrary library = TemplateLibrary::loadManifest((dir.path() / "templates.yaml").string());

    ASSERT_EQ(library.size(), 2u);
    EXPECT_TRUE(library.contains(controls::kLikeButton));
    EXPECT_FALSE(library.contains(controls::kFollowButton));

    const ReferenceTemplate& like = library.at(controls::kLikeButton);
    EXPECT_DOUBLE_EQ(like.threshold, 0.7);
    EXPECT_EQ(like.image.cols, 32);
    EXPECT_EQ(like.image.rows, 24);

    const ReferenceTemplate& repost = library.at(controls::kRepostOption);
    EXPECT_DOUBLE_EQ(repost.threshold, 0.8);

    EXPECT_THROW(library.at(controls::kFollowButton), ImageLoadError);
}

TEST(TemplateManifestTest, DefaultThresholdIsUsedWhenManifestOmitsIt)
{
    TempDir dir("engage_manifest_default");
    writeSwatch(dir.path() / "follow.png", 16, 16);
    dir.write("templates.yaml", "templates:\n  - name: follow_button\n    path: follow.png\n");

    TemplateLibrary library = TemplateLibrary::loadManifest((dir.path() / "templates.yaml").string());

    EXPECT_DOUBLE_EQ(library.at(controls::kFollowButton).threshold, kDefaultThreshold);
}

TEST(TemplateManifestTest, MissingImageRaisesImageLoadError)
{
    TempDir dir("engage_manifest_missing");
    dir.write("templates.yaml", "templates:\n  - name: like_button\n    path: nowhere.png\n");

    EXPECT_THROW(TemplateLibrary::loadManifest((dir.path() / "templates.yaml").string()), ImageLoadError);
}

TEST(TemplateManifestTest, MalformedManifestsAreRejected)
{
    TempDir dir("engage_manifest_bad");
    writeSwatch(dir.path() / "like.png", 16, 16);
    dir.write("no_list.yaml", "default_threshold: 0.5\n");
    dir.write("bad_threshold.yaml", "templates:\n  - name: like_button\n    path: like.png\n    threshold: 1.5\n");
    dir.write("no_name.yaml", "templates:\n  - path: like.png\n");

    EXPECT_THROW(TemplateLibrary::loadManifest((dir.path() / "no_list.yaml").string()), std::runtime_error);
    EXPECT_THROW(TemplateLibrary::loadManifest((dir.path() / "bad_threshold.yaml").string()), std::runtime_error);
    EXPECT_THROW(TemplateLibrary::loadManifest((dir.path() / "no_name.yaml").string()), std::runtime_error);
    EXPECT_THROW(TemplateLibrary::loadManifest((dir.path() / "absent.yaml").string()), std::runtime_error);
}
