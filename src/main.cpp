#include "AwsCredentials.h"
#include "DualPane.h"
#include "ErrorStack.h"
#include "LocalPane.h"
#include "MainFrame.h"
#include "ObjectStorePane.h"
#include "S3Client.h"
#include "Settings.h"

#include <wx/cmdline.h>
#include <wx/log.h>
#include <wx/wx.h>

#include <cstdio>
#include <memory>
#include <optional>
#include <string>

class FerryApp final : public wxApp {
public:
  void OnInitCmdLine(wxCmdLineParser& parser) override {
    wxApp::OnInitCmdLine(parser);

    parser.AddOption("", "left-pane", "provider of the left pane: fs or s3");
    parser.AddOption("", "right-pane", "provider of the right pane: fs or s3");
    parser.AddOption("", "left-dir", "start directory or key prefix of the left pane");
    parser.AddOption("", "right-dir", "start directory or key prefix of the right pane");
    parser.AddOption("", "aws-region", "AWS region of the bucket");
    parser.AddOption("", "s3-bucket-name", "bucket shown by s3 panes");
    parser.AddOption("", "s3-endpoint", "S3-compatible endpoint URL");
    parser.AddOption("", "aws-profile", "profile in the shared AWS files");
    parser.AddOption("", "workers", "concurrent transfers", wxCMD_LINE_VAL_NUMBER);

    parser.SetLogo("Usage: ferry [--left-pane fs|s3] [--right-pane fs|s3] [options]\n\n"
                   "Two-pane file manager for the local filesystem and S3 buckets.\n");
  }

  bool OnCmdLineParsed(wxCmdLineParser& parser) override {
    if (!wxApp::OnCmdLineParsed(parser)) return false;

    if (parser.Found("verbose")) {
      LogToStderr();
      wxLog::SetVerbose(true);
    }

    settings_ = settings::Load();

    wxString value;
    if (parser.Found("left-pane", &value) && !ApplyProvider(value, settings_.left)) return false;
    if (parser.Found("right-pane", &value) && !ApplyProvider(value, settings_.right)) return false;
    if (parser.Found("left-dir", &value)) settings_.left.location = value.ToStdString(wxConvUTF8);
    if (parser.Found("right-dir", &value)) settings_.right.location = value.ToStdString(wxConvUTF8);
    if (parser.Found("aws-region", &value)) settings_.region = value.ToStdString();
    if (parser.Found("s3-bucket-name", &value)) settings_.bucket = value.ToStdString();
    if (parser.Found("s3-endpoint", &value)) settings_.endpoint = value.ToStdString();
    if (parser.Found("aws-profile", &value)) settings_.profile = value.ToStdString();

    long workers = 0;
    if (parser.Found("workers", &workers)) {
      if (workers <= 0) {
        wxLogError("--workers must be a positive number");
        return false;
      }
      settings_.workers = workers;
    }
    return true;
  }

  bool OnInit() override {
    if (!wxApp::OnInit()) return false;

    auto left = MakePane(settings_.left);
    auto right = MakePane(settings_.right);
    if (!left || !right) return false;

    auto panes = std::make_unique<DualPane>(std::move(left), std::move(right), std::make_shared<ErrorStack>(),
                                            static_cast<std::size_t>(settings_.workers));
    auto* frame = new MainFrame(std::move(panes));
    frame->Show(true);
    // Startup problems above still reach the user as dialogs; from here on
    // failures are listed by the frame.
    LogToStderr();
    return true;
  }

  int OnExit() override {
    settings::Save(settings_);
    return wxApp::OnExit();
  }

private:
  static bool ApplyProvider(const wxString& name, settings::PaneSettings& pane) {
    const auto provider = settings::ParseProvider(name.ToStdString());
    if (!provider) {
      wxLogError("Unknown pane provider '%s' (expected fs or s3)", name);
      return false;
    }
    pane.provider = *provider;
    return true;
  }

  std::shared_ptr<StoragePane> MakePane(const settings::PaneSettings& pane) {
    if (pane.provider == settings::Provider::Filesystem) return std::make_shared<LocalPane>(pane.location);

    auto client = S3ClientFor();
    if (!client) return nullptr;
    return std::make_shared<ObjectStorePane>(std::move(client), pane.location);
  }

  // Both s3 panes share one client.
  std::shared_ptr<S3Client> S3ClientFor() {
    if (s3Client_) return s3Client_;
    if (settings_.bucket.empty()) {
      wxLogError("An s3 pane needs a bucket: pass --s3-bucket-name");
      return nullptr;
    }

    const auto profile = aws::ResolveProfile(settings_.profile);
    auto credentials = aws::ResolveCredentials(profile);
    if (!credentials) wxLogWarning("No AWS credentials found for profile '%s'", profile);

    s3Client_ = std::make_shared<S3Client>(S3ClientConfig{
        .bucket = settings_.bucket,
        .region = aws::ResolveRegion(settings_.region, profile),
        .endpoint = settings_.endpoint,
        .credentials = std::move(credentials),
    });
    wxLogVerbose("S3 bucket %s at %s", settings_.bucket, s3Client_->Endpoint());
    return s3Client_;
  }

  settings::Settings settings_{};
  std::shared_ptr<S3Client> s3Client_{};
};

wxIMPLEMENT_APP(FerryApp);
