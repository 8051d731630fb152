#include "TransferEngine.hpp"
#include "TestUtils.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

#include <unistd.h>

namespace {

namespace FS = std::filesystem;

const std::string CameraPattern = "^([^_]+)_([^_]+)_(ACam|BCam|CCam)_(.+)$";

FilenameClassifier MakeClassifier(const TempDir& Destination) {
  return FilenameClassifier(CameraPattern, "{client}/{project}/{camera}", "Unsorted", Destination.String());
}

std::vector<std::string> WriteSources(const TempDir& Source, const std::vector<std::string>& Names) {
  std::vector<std::string> Paths;
  for (const auto& Name : Names) {
    FS::path Path = Source.Path() / Name;
    WriteFile(Path, "test content for " + Name);
    Paths.push_back(Path.string());
  }
  return Paths;
}

void TestTransfersIntoOrganizedTree() {
  TempDir Source("engine-src");
  TempDir Destination("engine-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::PriorityPrefixes = { "Priority" };

  std::vector<std::string> Files = WriteSources(Source, {
      "Priority_Client1_ACam_001.mp4",
      "Project1_Client1_ACam_002.mp4",
      "Project1_Client1_BCam_001.mp4",
      "Project2_Client2_CCam_010.mov",
      "unmatched_file.mp4",
  });

  uint64_t TotalBytes = 0;
  for (const auto& File : Files) {
    TotalBytes += FS::file_size(File);
  }

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(Engine.Transfer("card0", Files));

  const FS::path Root = Destination.Path();
  assert(ReadFile(Root / "Client1/Priority/ACam/001.mp4") == "test content for Priority_Client1_ACam_001.mp4");
  assert(ReadFile(Root / "Client1/Project1/ACam/002.mp4") == "test content for Project1_Client1_ACam_002.mp4");
  assert(ReadFile(Root / "Client1/Project1/BCam/001.mp4") == "test content for Project1_Client1_BCam_001.mp4");
  assert(ReadFile(Root / "Client2/Project2/CCam/010.mov") == "test content for Project2_Client2_CCam_010.mov");
  assert(ReadFile(Root / "Unsorted/unmatched_file.mp4") == "test content for unmatched_file.mp4");

  TransferStatsSnapshot Stats = Engine.GetStats();
  assert(Stats.TotalFiles == 5);
  assert(Stats.ProcessedFiles == Stats.TotalFiles);
  assert(Stats.FailedFiles == 0);
  assert(Stats.TotalBytes == TotalBytes);
  assert(Stats.TransferredBytes == TotalBytes);
  assert(Engine.GetProgress() == 100.0);

  // Source side is never modified
  for (const auto& File : Files) {
    assert(FS::exists(File));
  }
}

void TestPriorityJobsAreDispatchedFirst() {
  TempDir Source("engine-prio-src");
  TempDir Destination("engine-prio-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::MaxWorkers = 1;
  ConfigGlobal::PriorityPrefixes = { "URGENT", "Rush" };

  std::vector<std::string> Files = WriteSources(Source, {
      "a_normal.mov",
      "URGENT_Client_ACam_1.mov",
      "b_normal.mov",
      "urgent_lowercase.mov",
      "Rush_Client_BCam_2.mov",
      "c_normal.mov",
  });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);

  std::mutex OrderMutex;
  std::vector<std::string> Dispatched;
  Engine.SetDispatchObserver([&](const TransferJob& Job) {
    std::lock_guard<std::mutex> Lock(OrderMutex);
    Dispatched.push_back(Job.File.FileName);
  });

  assert(Engine.Transfer("card1", Files));

  const std::vector<std::string> Expected = {
      "URGENT_Client_ACam_1.mov",
      "Rush_Client_BCam_2.mov",
      "a_normal.mov",
      "b_normal.mov",
      "urgent_lowercase.mov",
      "c_normal.mov",
  };
  assert(Dispatched == Expected);
  assert(Engine.GetStats().ProcessedFiles == Files.size());
}

void TestOrderForDispatchIsStablePartition() {
  std::vector<TransferJob> Jobs(5);
  const bool Priority[] = { false, true, false, true, false };
  for (size_t i = 0; i < Jobs.size(); ++i) {
    Jobs[i].SourcePath = std::to_string(i);
    Jobs[i].Priority = Priority[i];
  }

  std::vector<TransferJob> Ordered = TransferEngine::OrderForDispatch(Jobs);
  std::vector<std::string> Sources;
  for (const auto& Job : Ordered) {
    Sources.push_back(Job.SourcePath);
  }
  assert((Sources == std::vector<std::string>{ "1", "3", "0", "2", "4" }));
}

void TestCollisionsAreVersioned() {
  TempDir Source("engine-version-src");
  TempDir Destination("engine-version-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::MaxWorkers = 3;

  WriteFile(Destination.Path() / "Nike/BrandVideo/ACam/001.mp4", "from an earlier card");

  std::vector<std::string> Files = WriteSources(Source, {
      "day1/BrandVideo_Nike_ACam_001.mp4",
      "day2/BrandVideo_Nike_ACam_001.mp4",
  });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(Engine.Transfer("card2", Files));

  const FS::path Dir = Destination.Path() / "Nike/BrandVideo/ACam";
  assert(ReadFile(Dir / "001.mp4") == "from an earlier card");
  assert(ReadFile(Dir / "001_v2.mp4") == "test content for day1/BrandVideo_Nike_ACam_001.mp4");
  assert(ReadFile(Dir / "001_v3.mp4") == "test content for day2/BrandVideo_Nike_ACam_001.mp4");
  assert(!FS::exists(Dir / "001_v4.mp4"));
  assert(Engine.GetStats().FailedFiles == 0);
}

void TestCorruptionDetectedWhenVerifying() {
  TempDir Source("engine-verify-src");
  TempDir Destination("engine-verify-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::VerifyChecksums = true;

  std::vector<std::string> Files = WriteSources(Source, { "Interview_Tesla_CCam_Take5.mxf" });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  Engine.SetAfterWriteHook([](const std::string& Written) {
    std::ofstream Out(Written, std::ios::binary | std::ios::app);
    Out << "bit rot";
  });

  assert(Engine.Transfer("card3", Files));

  assert(!FS::exists(Destination.Path() / "Tesla/Interview/CCam/Take5.mxf"));
  TransferStatsSnapshot Stats = Engine.GetStats();
  assert(Stats.TotalFiles == 1);
  assert(Stats.ProcessedFiles == 1);
  assert(Stats.FailedFiles == 1);
  assert(Stats.TransferredBytes == 0);
}

void TestCorruptionUndetectedWithoutVerification() {
  TempDir Source("engine-noverify-src");
  TempDir Destination("engine-noverify-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::VerifyChecksums = false;

  std::vector<std::string> Files = WriteSources(Source, { "Interview_Tesla_CCam_Take5.mxf" });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  Engine.SetAfterWriteHook([](const std::string& Written) {
    std::ofstream Out(Written, std::ios::binary | std::ios::app);
    Out << "bit rot";
  });

  assert(Engine.Transfer("card4", Files));

  const FS::path Written = Destination.Path() / "Tesla/Interview/CCam/Take5.mxf";
  assert(FS::exists(Written));
  assert(ReadFile(Written) == "test content for Interview_Tesla_CCam_Take5.mxfbit rot");
  TransferStatsSnapshot Stats = Engine.GetStats();
  assert(Stats.ProcessedFiles == 1);
  assert(Stats.FailedFiles == 0);
}

void TestRetryRecoversFromTransientMismatch() {
  TempDir Source("engine-retry-src");
  TempDir Destination("engine-retry-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::VerifyChecksums = true;
  ConfigGlobal::MaxRetries = 2;

  std::vector<std::string> Files = WriteSources(Source, { "random_video.mp4" });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  std::atomic<int> Attempts{ 0 };
  Engine.SetAfterWriteHook([&Attempts](const std::string& Written) {
    if (Attempts++ == 0) {
      std::ofstream Out(Written, std::ios::binary | std::ios::app);
      Out << "x";
    }
  });

  assert(Engine.Transfer("card5", Files));

  assert(Attempts == 2);
  assert(ReadFile(Destination.Path() / "Unsorted/random_video.mp4") == "test content for random_video.mp4");
  assert(Engine.GetStats().FailedFiles == 0);
}

void TestNoRetryByDefault() {
  TempDir Source("engine-noretry-src");
  TempDir Destination("engine-noretry-dst");
  ResetIngestConfig(Destination.String());

  std::vector<std::string> Files = WriteSources(Source, { "random_video.mp4" });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  std::atomic<int> Attempts{ 0 };
  Engine.SetAfterWriteHook([&Attempts](const std::string& Written) {
    ++Attempts;
    std::ofstream Out(Written, std::ios::binary | std::ios::app);
    Out << "x";
  });

  assert(Engine.Transfer("card6", Files));
  assert(Attempts == 1);
  assert(Engine.GetStats().FailedFiles == 1);
}

void TestFailedFilesDoNotStopSiblings() {
  TempDir Source("engine-partial-src");
  TempDir Destination("engine-partial-dst");
  ResetIngestConfig(Destination.String());

  std::vector<std::string> Files = WriteSources(Source, {
      "BrandVideo_Nike_ACam_001.mp4",
      "BrandVideo_Nike_ACam_002.mp4",
  });
  Files.insert(Files.begin() + 1, (Source.Path() / "vanished_before_copy.mp4").string());
  Files.push_back(Source.Path().string());

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(Engine.Transfer("card7", Files));

  assert(FS::exists(Destination.Path() / "Nike/BrandVideo/ACam/001.mp4"));
  assert(FS::exists(Destination.Path() / "Nike/BrandVideo/ACam/002.mp4"));
  assert(!FS::exists(Destination.Path() / "Unsorted/vanished_before_copy.mp4"));

  TransferStatsSnapshot Stats = Engine.GetStats();
  assert(Stats.TotalFiles == 4);
  assert(Stats.ProcessedFiles == 4);
  assert(Stats.FailedFiles == 2);
}

void TestUnreadableSourceLeavesNoPlaceholder() {
  if (geteuid() == 0) {
    return; // root ignores file permissions
  }

  TempDir Source("engine-perm-src");
  TempDir Destination("engine-perm-dst");
  ResetIngestConfig(Destination.String());

  std::vector<std::string> Files = WriteSources(Source, { "locked_clip.mp4" });
  FS::permissions(Files[0], FS::perms::none);

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(Engine.Transfer("card8", Files));

  assert(!FS::exists(Destination.Path() / "Unsorted/locked_clip.mp4"));
  assert(Engine.GetStats().FailedFiles == 1);

  FS::permissions(Files[0], FS::perms::owner_all);
}

void TestZeroWorkersIsAStructuralError() {
  TempDir Source("engine-zero-src");
  TempDir Destination("engine-zero-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::MaxWorkers = 0;

  std::vector<std::string> Files = WriteSources(Source, { "random_video.mp4" });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(!Engine.Transfer("card9", Files));
  assert(!FS::exists(Destination.Path() / "Unsorted"));
}

void TestManyFilesThroughBoundedQueue() {
  TempDir Source("engine-many-src");
  TempDir Destination("engine-many-dst");
  ResetIngestConfig(Destination.String());
  ConfigGlobal::MaxWorkers = 4;
  ConfigGlobal::PriorityPrefixes = { "Hero" };

  std::vector<std::string> Names;
  for (int i = 0; i < 200; ++i) {
    Names.push_back((i % 7 == 0 ? "Hero_Acme_BCam_" : "Spot_Acme_ACam_") + std::to_string(i) + ".mp4");
  }
  std::vector<std::string> Files = WriteSources(Source, Names);

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);

  std::vector<bool> PriorityOrder;
  Engine.SetDispatchObserver([&PriorityOrder](const TransferJob& Job) { PriorityOrder.push_back(Job.Priority); });

  assert(Engine.Transfer("card10", Files));

  assert(std::is_sorted(PriorityOrder.begin(), PriorityOrder.end(), [](bool A, bool B) { return A && !B; }));
  TransferStatsSnapshot Stats = Engine.GetStats();
  assert(Stats.TotalFiles == 200);
  assert(Stats.ProcessedFiles == 200);
  assert(Stats.FailedFiles == 0);
  assert(Stats.TransferredBytes == Stats.TotalBytes);
}

void TestRetryKeepsTheReservedName() {
  TempDir SourceA("engine-hold-src-a");
  TempDir SourceB("engine-hold-src-b");
  TempDir Destination("engine-hold-dst");
  ResetIngestConfig(Destination.String());
  FilenameClassifier Classifier = MakeClassifier(Destination);

  WriteFile(SourceA.Path() / "random_video.mp4", "card A footage");
  WriteFile(SourceB.Path() / "random_video.mp4", "card B footage");

  ConfigGlobal::VerifyChecksums = true;
  ConfigGlobal::MaxRetries = 1;
  ConfigGlobal::RetryBackoffMs = 400;
  TransferEngine EngineA(Classifier);

  ConfigGlobal::MaxRetries = 0;
  ConfigGlobal::RetryBackoffMs = 1;
  TransferEngine EngineB(Classifier);

  std::mutex CorruptedMutex;
  std::condition_variable Corrupted_CV;
  bool Corrupted = false;
  std::atomic<int> Attempts{ 0 };
  EngineA.SetAfterWriteHook([&](const std::string& Written) {
    if (Attempts++ == 0) {
      {
        std::ofstream Out(Written, std::ios::binary | std::ios::app);
        Out << "x";
      }
      std::lock_guard<std::mutex> Lock(CorruptedMutex);
      Corrupted = true;
      Corrupted_CV.notify_all();
    }
  });

  // Card B arrives while card A's first attempt has failed and its retry is backing off
  std::thread SecondCard([&]() {
    {
      std::unique_lock<std::mutex> Lock(CorruptedMutex);
      Corrupted_CV.wait(Lock, [&] { return Corrupted; });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(EngineB.Transfer("cardB", { (SourceB.Path() / "random_video.mp4").string() }));
  });

  assert(EngineA.Transfer("cardA", { (SourceA.Path() / "random_video.mp4").string() }));
  SecondCard.join();

  assert(Attempts == 2);
  assert(EngineA.GetStats().FailedFiles == 0);
  assert(EngineB.GetStats().FailedFiles == 0);

  const FS::path Dir = Destination.Path() / "Unsorted";
  assert(ReadFile(Dir / "random_video.mp4") == "card A footage");
  assert(ReadFile(Dir / "random_video_v2.mp4") == "card B footage");
}

void TestMismatchKeepsDestinationClaimed() {
  TempDir Source("engine-claim-src");
  TempDir Destination("engine-claim-dst");
  ResetIngestConfig(Destination.String());

  std::vector<std::string> Files = WriteSources(Source, { "random_video.mp4" });
  const FS::path Claimed = Destination.Path() / "random_video.mp4";

  std::string Error;
  CopyResult Result = FileCopier::PerformFileCopy(Files[0], Claimed.string(), true, 4096, Error, [](const std::string& Written) {
    std::ofstream Out(Written, std::ios::binary | std::ios::app);
    Out << "x";
  });
  assert(Result == CopyResult::ChecksumMismatch);
  assert(!Error.empty());

  // The name stays taken until the owner of the reservation releases it
  FS::path Next;
  FilenameClassifier Classifier = MakeClassifier(Destination);
  assert(FS::exists(Claimed));
  assert(Classifier.ReserveUniquePath(Claimed, Next, Error));
  assert(Next == Destination.Path() / "random_video_v2.mp4");

  // A second attempt rewrites the same file in place
  Result = FileCopier::PerformFileCopy(Files[0], Claimed.string(), true, 4096, Error);
  assert(Result == CopyResult::Success);
  assert(ReadFile(Claimed) == "test content for random_video.mp4");
}

void TestVersionExhaustionFailsOnlyThatFile() {
  TempDir Source("engine-exhaust-src");
  TempDir Destination("engine-exhaust-dst");
  ResetIngestConfig(Destination.String());

  const FS::path Dir = Destination.Path() / "Nike/BrandVideo/ACam";
  WriteFile(Dir / "001.mp4", "original");
  for (int Version = 2; Version <= FilenameClassifier::MaxVersionCandidates + 1; ++Version) {
    WriteFile(Dir / ("001_v" + std::to_string(Version) + ".mp4"), "old");
  }

  std::vector<std::string> Files = WriteSources(Source, {
      "BrandVideo_Nike_ACam_001.mp4",
      "BrandVideo_Nike_ACam_002.mp4",
  });

  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(Engine.Transfer("card12", Files));

  assert(ReadFile(Dir / "002.mp4") == "test content for BrandVideo_Nike_ACam_002.mp4");
  assert(ReadFile(Dir / "001.mp4") == "original");
  assert(!FS::exists(Dir / ("001_v" + std::to_string(FilenameClassifier::MaxVersionCandidates + 2) + ".mp4")));

  TransferStatsSnapshot Stats = Engine.GetStats();
  assert(Stats.TotalFiles == 2);
  assert(Stats.ProcessedFiles == Stats.TotalFiles);
  assert(Stats.FailedFiles == 1);
}

void TestDestinationRootComesFromClassifier() {
  TempDir Source("engine-root-src");
  TempDir Destination("engine-root-dst");
  TempDir Elsewhere("engine-root-other");
  ResetIngestConfig((Elsewhere.Path() / "configured").string());

  std::vector<std::string> Files = WriteSources(Source, { "random_video.mp4" });
  FilenameClassifier Classifier = MakeClassifier(Destination);
  TransferEngine Engine(Classifier);
  assert(Engine.Transfer("card13", Files));

  assert(ReadFile(Destination.Path() / "Unsorted/random_video.mp4") == "test content for random_video.mp4");
  assert(!FS::exists(Elsewhere.Path() / "configured"));
}

} // namespace

int main() {
  TestTransfersIntoOrganizedTree();
  TestPriorityJobsAreDispatchedFirst();
  TestOrderForDispatchIsStablePartition();
  TestCollisionsAreVersioned();
  TestCorruptionDetectedWhenVerifying();
  TestCorruptionUndetectedWithoutVerification();
  TestRetryRecoversFromTransientMismatch();
  TestNoRetryByDefault();
  TestFailedFilesDoNotStopSiblings();
  TestUnreadableSourceLeavesNoPlaceholder();
  TestZeroWorkersIsAStructuralError();
  TestManyFilesThroughBoundedQueue();
  TestRetryKeepsTheReservedName();
  TestMismatchKeepsDestinationClaimed();
  TestVersionExhaustionFailsOnlyThatFile();
  TestDestinationRootComesFromClassifier();

  std::cout << "media_ingest_transfer_engine: pass\n";
  return 0;
}
