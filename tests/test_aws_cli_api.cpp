#include <gtest/gtest.h>
#include <cloud/aws_cli_api.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

// Runs AwsCliApi against a shell script standing in for the aws CLI. The
// script records its arguments one per line, then plays a scripted reply.
class AwsCliApiTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path args_file;

    void SetUp() override {
        dir = fs::temp_directory_path() / "ec2ctl_aws_cli_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
        args_file = dir / "args";
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    AwsConfig fake_cli(const std::string& reply, const std::string& profile = "") {
        auto script = dir / "aws";
        std::ofstream(script) << "#!/bin/sh\n"
                              << "printf '%s\\n' \"$@\" > '" << args_file.string() << "'\n"
                              << reply << "\n";
        fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

        AwsConfig aws;
        aws.cli = script.string();
        aws.profile = profile;
        return aws;
    }

    std::vector<std::string> recorded_args() const {
        std::ifstream in(args_file);
        std::vector<std::string> out;
        std::string line;
        while (std::getline(in, line)) out.push_back(line);
        return out;
    }
};

TEST_F(AwsCliApiTest, DescribeInstancesDrivesPaginationItself) {
    AwsCliApi api(fake_cli("echo '{\"Reservations\": [], \"NextToken\": \"tok-3\"}'", "ops"), 50);

    auto page = api.describe_instances("eu-west-1", "tok-2", 5000ms);

    ASSERT_TRUE(page.is_ok()) << page.error;
    EXPECT_EQ(page.value.next_token, "tok-3");
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "ec2", "describe-instances", "--output", "json", "--region", "eu-west-1",
        "--profile", "ops", "--no-paginate", "--max-results", "50", "--next-token", "tok-2"}));
}

TEST_F(AwsCliApiTest, FirstPageHasNoTokenAndNoProfile) {
    AwsCliApi api(fake_cli("echo '{\"Reservations\": []}'"), 100);

    ASSERT_TRUE(api.describe_instances("us-west-2", "", 5000ms).is_ok());
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "ec2", "describe-instances", "--output", "json", "--region", "us-west-2",
        "--no-paginate", "--max-results", "100"}));
}

TEST_F(AwsCliApiTest, InstanceStatusArguments) {
    AwsCliApi api(fake_cli("echo '{\"InstanceStatuses\": []}'"), 100);

    auto health = api.describe_instance_status("ap-south-1", "i-0abc", 5000ms);

    ASSERT_TRUE(health.is_ok()) << health.error;
    EXPECT_FALSE(health.value.reported());
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "ec2", "describe-instance-status", "--output", "json", "--region", "ap-south-1",
        "--instance-ids", "i-0abc", "--include-all-instances"}));
}

TEST_F(AwsCliApiTest, RegionListUsesDefaultRegion) {
    AwsCliApi api(fake_cli("echo '{\"Regions\": [{\"RegionName\": \"us-east-1\"}]}'"), 100);

    auto regions = api.list_regions(5000ms);

    ASSERT_TRUE(regions.is_ok()) << regions.error;
    EXPECT_EQ(regions.value, (std::vector<std::string>{"us-east-1"}));
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "ec2", "describe-regions", "--output", "json", "--region", "us-east-1"}));
}

TEST_F(AwsCliApiTest, MissingCredentialsIsAuth) {
    AwsCliApi api(fake_cli("echo 'Unable to locate credentials. You can configure credentials by "
                           "running \"aws configure\".' >&2; exit 253"), 100);

    auto page = api.describe_instances("us-east-1", "", 5000ms);

    EXPECT_TRUE(page.is_err());
    EXPECT_EQ(page.kind, ErrorKind::Auth);
}

TEST_F(AwsCliApiTest, ControlRefusalIsAction) {
    AwsCliApi api(fake_cli("echo 'An error occurred (IncorrectInstanceState) when calling the "
                           "StopInstances operation: The instance is not running.' >&2; exit 254"), 100);

    auto r = api.stop_instance("us-east-1", "i-1", 5000ms);

    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Action);
    EXPECT_EQ(r.error, "IncorrectInstanceState: The instance is not running.");
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "ec2", "stop-instances", "--output", "json", "--region", "us-east-1",
        "--instance-ids", "i-1"}));
}

TEST_F(AwsCliApiTest, HungCliTimesOut) {
    AwsCliApi api(fake_cli("sleep 10"), 100);

    auto page = api.describe_instances("us-east-1", "", 300ms);

    EXPECT_TRUE(page.is_err());
    EXPECT_EQ(page.kind, ErrorKind::Timeout);
    EXPECT_NE(page.error.find("300ms"), std::string::npos);
}
