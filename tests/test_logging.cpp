#include "nomaiq_logging.h"

#include <QSet>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{

// MARK: - Tests:

TEST(TestLogging, every_component_has_its_own_category)
{
    const QList<const QLoggingCategory *> categories = {
        &coordinatorLog(), &schedulerLog(), &aylaLog(), &lightLog(), &coverLog(), &sidecarLog(),
    };

    QSet<QString> names;
    for (const QLoggingCategory *category : categories)
        names.insert(QString::fromLatin1(category->categoryName()));
    EXPECT_EQ(names.size(), categories.size());

    EXPECT_STREQ(coordinatorLog().categoryName(), "phi-adapter.nomaiq.coordinator");
    EXPECT_STREQ(lightLog().categoryName(), "phi-adapter.nomaiq.light");
}

} // namespace
