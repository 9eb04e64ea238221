#include <glog/logging.h>
#include <gtest/gtest.h>
#include <iostream>
int main(int argc, char **argv)
{
    testing::InitGoogleTest(&argc, argv);
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    FLAGS_minloglevel = google::GLOG_WARNING;

    int v = 0;
    try
    {
        v = RUN_ALL_TESTS();
    } catch (std::exception &e)
    {
        std::cout << e.what() << std::endl;
        v = 1;
    }
    google::ShutdownGoogleLogging();
    return v;
}
